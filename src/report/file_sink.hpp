#pragma once
#include <fmt/format.h>
#include <cstddef>
#include <filesystem>
#include <exception>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "../core/errors.hpp"
#include "../core/profile.hpp"
#include "../core/table.hpp"
#include "../pipeline/persistence.hpp"
#include "../util/log.hpp"
#include "emit_profile_json.hpp"
#include "render_context.hpp"

namespace dsprof {

// RFC 4180 field; quoted only when needed.
inline std::string csv_field(std::string_view v, char delimiter = ',') {
    const bool quote = v.find_first_of(std::string{delimiter, '"', '\n', '\r'}) != std::string_view::npos;
    if (!quote) return std::string(v);
    std::string out = "\"";
    for (char c : v) {
        if (c == '"') out += "\"\"";
        else out.push_back(c);
    }
    return out + "\"";
}

// Directory-backed sink: schema.sql, rows.csv, profile.json and context.txt are staged as
// *.partial files. Commit moves the previous dataset aside as *.previous, installs the staged
// files, and puts the previous files back if any rename fails.
class FileSink : public PersistenceSink {
public:
    explicit FileSink(std::filesystem::path dir, std::string context_template = default_context_template())
        : dir_(std::move(dir)), template_(std::move(context_template)) {}

    ~FileSink() override {
        if (open_) rollback();
    }

    void begin_dataset(const SchemaDocument& schema) override {
        if (open_) throw Error("dataset already open in " + dir_.string());
        std::filesystem::create_directories(dir_);
        open_ = true;
        staged_.clear();

        write_staged("schema.sql", schema.create_table_sql);

        rows_.open(stage_path("rows.csv"), std::ios::binary | std::ios::trunc);
        if (!rows_) throw Error("failed to open for write: " + stage_path("rows.csv").string());
        staged_.push_back("rows.csv");
        std::vector<std::string> header;
        for (const auto& c : schema.columns) header.push_back(csv_field(c.name));
        rows_ << join(header, ",") << '\n';
        columns_ = schema.columns.size();
    }

    void write_rows(const ColumnarTable& table, std::size_t first_row, std::size_t row_count) override {
        if (!open_) throw Error("write_rows before begin_dataset");
        if (table.column_count() != columns_)
            throw Error(fmt::format("table has {} columns, schema has {}", table.column_count(), columns_));
        std::string line;
        for (std::size_t r = first_row; r < first_row + row_count; ++r) {
            line.clear();
            for (std::size_t c = 0; c < columns_; ++c) {
                if (c) line.push_back(',');
                line += csv_field(render_value(table.column(c), r));
            }
            line.push_back('\n');
            rows_ << line;
        }
        if (!rows_) throw Error("failed writing rows to " + stage_path("rows.csv").string());
        ++batches_;
    }

    void write_profiles(const DatasetProfile& profile) override {
        if (!open_) throw Error("write_profiles before begin_dataset");
        write_staged("profile.json", profile_to_json(profile));
        write_staged("context.txt", render_context(profile, template_));
    }

    void commit() override {
        if (!open_) throw Error("commit without an open dataset");
        rows_.close();
        if (rows_.fail()) throw Error("failed to flush " + stage_path("rows.csv").string());

        std::vector<std::string> backed_up, installed;
        try {
            for (const auto& name : staged_) {
                if (!std::filesystem::exists(dir_ / name)) continue;
                std::filesystem::rename(dir_ / name, backup_path(name));
                backed_up.push_back(name);
            }
            for (const auto& name : staged_) {
                std::filesystem::rename(stage_path(name), dir_ / name);
                installed.push_back(name);
            }
        } catch (const std::filesystem::filesystem_error&) {
            restore_previous(installed, backed_up);
            rollback();
            std::throw_with_nested(Error("commit to " + dir_.string() + " failed; previous dataset kept"));
        }

        for (const auto& name : backed_up) {
            std::error_code ec;
            std::filesystem::remove(backup_path(name), ec);
            if (ec) log_warn("could not remove {}: {}", backup_path(name).string(), ec.message());
        }
        log_debug("committed {} files to {}", staged_.size(), dir_.string());
        staged_.clear();
        open_ = false;
    }

    void rollback() noexcept override {
        if (rows_.is_open()) rows_.close();
        for (const auto& name : staged_) {
            std::error_code ec;
            std::filesystem::remove(stage_path(name), ec);
        }
        staged_.clear();
        open_ = false;
    }

    std::size_t batches_written() const { return batches_; }

private:
    std::filesystem::path stage_path(const std::string& name) const { return dir_ / (name + ".partial"); }
    std::filesystem::path backup_path(const std::string& name) const { return dir_ / (name + ".previous"); }

    void restore_previous(const std::vector<std::string>& installed, const std::vector<std::string>& backed_up) {
        for (const auto& name : installed) {
            std::error_code ec;
            std::filesystem::remove(dir_ / name, ec);
        }
        for (const auto& name : backed_up) {
            std::error_code ec;
            std::filesystem::rename(backup_path(name), dir_ / name, ec);
            if (ec) log_error("could not restore {}: {}", (dir_ / name).string(), ec.message());
        }
    }

    void write_staged(const std::string& name, std::string_view content) {
        std::ofstream f(stage_path(name), std::ios::binary | std::ios::trunc);
        if (!f) throw Error("failed to open for write: " + stage_path(name).string());
        staged_.push_back(name);
        f << content;
        if (!f) throw Error("failed to write: " + stage_path(name).string());
    }

    std::filesystem::path dir_;
    std::string template_;
    std::ofstream rows_;
    std::vector<std::string> staged_;
    std::size_t columns_ = 0;
    std::size_t batches_ = 0;
    bool open_ = false;
};

}
