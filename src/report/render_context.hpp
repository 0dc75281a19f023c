#pragma once
#include <mustache.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include "../core/errors.hpp"
#include "../core/profile.hpp"
#include "../util/strings.hpp"

namespace dsprof {

namespace mst = kainjow::mustache;

// Plain-text prompt context; every tag is triple-braced so nothing is HTML-escaped.
inline const char* default_context_template() {
    return
        "Table {{{table_name}}} (from {{{source_filename}}}): {{{row_count}}} rows, {{{column_count}}} columns.\n"
        "\n"
        "Columns:\n"
        "{{#columns}}"
        "- {{{name}}} {{{sql_type}}}: {{{description}}}\n"
        "{{#has_enum}}  Allowed values: {{{enum_values}}}\n{{/has_enum}}"
        "{{#has_synonyms}}  Also called: {{{synonyms}}}\n{{/has_synonyms}}"
        "{{#has_hint}}  Hint: {{{hint}}}\n{{/has_hint}}"
        "{{/columns}}"
        "\n"
        "Example queries:\n"
        "{{#example_queries}}"
        "{{{.}}}\n"
        "{{/example_queries}}"
        "{{#has_warnings}}"
        "\nNotes:\n"
        "{{#warnings}}- {{{.}}}\n{{/warnings}}"
        "{{/has_warnings}}";
}

inline std::filesystem::path exe_dir() {
    std::error_code ec;
    auto p = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) return std::filesystem::current_path();
    return p.parent_path();
}

// Resolves `name` as given, then under <exe_dir>/templates and <cwd>/templates.
// Returns an empty path when none exists.
inline std::filesystem::path find_template(const std::filesystem::path& name) {
    namespace fs = std::filesystem;
    const std::vector<fs::path> candidates = {
        name,
        exe_dir() / "templates" / name.filename(),
        fs::current_path() / "templates" / name.filename(),
    };
    for (const auto& c : candidates) {
        std::error_code ec;
        if (fs::exists(c, ec) && fs::is_regular_file(c, ec)) return c;
    }
    return {};
}

inline std::string read_template(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw Error("failed to read template: " + p.string());
    std::ostringstream oss;
    oss << f.rdbuf();
    return oss.str();
}

inline mst::data context_data(const DatasetProfile& p) {
    mst::data ctx;
    ctx.set("table_name", p.table_name);
    ctx.set("source_filename", p.source_filename);
    ctx.set("row_count", std::to_string(p.row_count));
    ctx.set("column_count", std::to_string(p.column_count));
    ctx.set("schema_summary", p.schema_summary);

    mst::data columns{mst::data::type::list};
    for (const auto& c : p.columns) {
        mst::data col;
        col.set("name", c.name);
        col.set("source_name", c.source_name);
        col.set("type", to_string(c.type));
        col.set("sql_type", c.sql_type);
        col.set("description", c.description);

        col.set("has_enum", mst::data(c.enum_values.has_value() && !c.enum_values->empty()));
        if (c.enum_values) col.set("enum_values", join(*c.enum_values, ", "));

        std::vector<std::string> synonyms;
        auto it = c.synonym_mappings.find(c.name);
        if (it != c.synonym_mappings.end()) synonyms = it->second;
        col.set("has_synonyms", mst::data(!synonyms.empty()));
        col.set("synonyms", join(synonyms, ", "));

        auto hint = p.query_hints.find(c.name);
        col.set("has_hint", mst::data(hint != p.query_hints.end()));
        if (hint != p.query_hints.end()) col.set("hint", hint->second);
        columns.push_back(col);
    }
    ctx.set("columns", columns);

    mst::data queries{mst::data::type::list};
    for (const auto& q : p.example_queries) queries.push_back(mst::data(q));
    ctx.set("example_queries", queries);

    mst::data warnings{mst::data::type::list};
    for (const auto& w : p.warnings) warnings.push_back(mst::data(w.column + ": " + w.message));
    ctx.set("has_warnings", mst::data(!p.warnings.empty()));
    ctx.set("warnings", warnings);
    return ctx;
}

inline std::string render_context(const DatasetProfile& p, const std::string& tmpl) {
    mst::mustache m{tmpl};
    if (!m.is_valid()) throw Error("mustache template parse error: " + m.error_message());
    return m.render(context_data(p));
}

inline std::string render_context(const DatasetProfile& p) {
    return render_context(p, default_context_template());
}

}
