#pragma once
#include <fmt/format.h>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace dsprof {

struct CsvDialect {
    char delimiter = ',';
    char quote = '"';
};

class csv_parse_error : public std::runtime_error {
public:
    csv_parse_error(std::uint64_t line, const std::string& what)
        : std::runtime_error(fmt::format("line {}: {}", line, what)), line_(line) {}
    std::uint64_t line() const { return line_; }
private:
    std::uint64_t line_;
};

// Pull parser over a decoded buffer.
// - RFC4180 quoting: "" inside quotes is a literal quote; quoted fields may span lines.
// - CR, LF and CRLF all end a record (outside quotes).
// - Blank lines are skipped.
// - Text after a closing quote is appended to the field ("ab"c -> abc).
class record_parser {
public:
    record_parser(std::string_view text, CsvDialect d, std::uint64_t first_line = 1)
        : text_(text), d_(d), line_(first_line) {}

    // Fills `fields` with the next record; false at end of input.
    bool next(std::vector<std::string>& fields) {
        fields.clear();
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (c == '\n' || c == '\r') { consume_newline(); continue; } // blank line
            break;
        }
        if (pos_ >= text_.size()) return false;

        record_line_ = line_;
        std::string cur;
        bool in_quotes = false;
        bool was_quoted = false;

        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (in_quotes) {
                if (c == d_.quote) {
                    if (pos_ + 1 < text_.size() && text_[pos_ + 1] == d_.quote) {
                        cur.push_back(d_.quote);
                        pos_ += 2;
                    } else {
                        in_quotes = false;
                        ++pos_;
                    }
                } else {
                    if (c == '\n' || (c == '\r' && !(pos_ + 1 < text_.size() && text_[pos_ + 1] == '\n'))) ++line_;
                    cur.push_back(c);
                    ++pos_;
                }
                continue;
            }
            if (c == d_.quote && cur.empty() && !was_quoted) {
                in_quotes = was_quoted = true;
                ++pos_;
            } else if (c == d_.delimiter) {
                fields.push_back(std::move(cur));
                cur.clear();
                was_quoted = false;
                ++pos_;
            } else if (c == '\n' || c == '\r') {
                consume_newline();
                fields.push_back(std::move(cur));
                return true;
            } else {
                cur.push_back(c);
                ++pos_;
            }
        }
        if (in_quotes)
            throw csv_parse_error(record_line_, "unterminated quoted field at end of input");
        fields.push_back(std::move(cur));
        return true;
    }

    std::size_t offset() const { return pos_; }
    std::uint64_t record_line() const { return record_line_; }

private:
    void consume_newline() {
        if (text_[pos_] == '\r' && pos_ + 1 < text_.size() && text_[pos_ + 1] == '\n') ++pos_;
        ++pos_;
        ++line_;
    }

    std::string_view text_;
    CsvDialect d_;
    std::size_t pos_ = 0;
    std::uint64_t line_;
    std::uint64_t record_line_ = 0;
};

}
