#include <jsonmanip-cpp/error.hpp>

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonmanip_cpp {

namespace {

struct Location {
    std::size_t line;
    std::size_t column;
    std::size_t line_start;
};

auto locate(std::string_view doc, std::size_t pos) -> Location {
    auto loc = Location{1, 1, 0};
    for (std::size_t i = 0; i < pos && i < doc.size(); ++i) {
        // \r\n counts once, at the \n
        const auto crlf = doc[i] == '\r' && i + 1 < doc.size() && doc[i + 1] == '\n';
        if (doc[i] == '\n' || (doc[i] == '\r' && !crlf)) {
            ++loc.line;
            loc.line_start = i + 1;
        }
    }
    loc.column = pos - loc.line_start + 1;
    return loc;
}

auto line_end(std::string_view doc, std::size_t pos) -> std::size_t {
    auto end = doc.find_first_of("\r\n", std::min(pos, doc.size()));
    return end == std::string_view::npos ? doc.size() : end;
}

auto format_range(std::size_t first, std::size_t last) -> std::string {
    if (first == last) return std::to_string(first);
    return std::to_string(first) + "-" + std::to_string(last);
}

}  // anonymous namespace

SyntaxError::SyntaxError(std::string msg, std::string filename, std::string doc,
                         std::size_t start, std::ptrdiff_t end)
    : Error{ErrorKind::syntax_error, msg},
      msg_{std::move(msg)},
      filename_{std::move(filename)},
      doc_{std::move(doc)},
      start_{std::min(start, doc_.size())},
      end_{start_} {
    if (end <= 0) {
        end_ = std::min(line_end(doc_, start_), start_ + static_cast<std::size_t>(-end));
    } else {
        end_ = std::clamp(static_cast<std::size_t>(end), start_, doc_.size());
    }

    const auto first = locate(doc_, start_);
    const auto last = locate(doc_, end_);
    lineno_ = first.line;
    colno_ = first.column;
    end_lineno_ = last.line;
    end_colno_ = last.column;

    what_ = msg_ + " (" + filename_ + ", line " + format_range(lineno_, end_lineno_) +
            ", column " + format_range(colno_, end_colno_) + ")";
}

auto format_syntax_error(const SyntaxError& exc) -> std::vector<std::string> {
    const auto first = locate(exc.doc(), exc.start());
    const auto text = std::string_view{exc.doc()}.substr(
        first.line_start, line_end(exc.doc(), first.line_start) - first.line_start);

    auto carets = std::size_t{1};
    if (exc.end_lineno() == exc.lineno()) {
        carets = std::max<std::size_t>(1, exc.end_colno() - exc.colno());
    } else {
        carets = std::max<std::size_t>(1, text.size() - exc.colno() + 1);
    }

    auto lines = std::vector<std::string>{};
    lines.push_back("  File \"" + exc.filename() + "\", line " +
                    format_range(exc.lineno(), exc.end_lineno()) + ", column " +
                    format_range(exc.colno(), exc.end_colno()) + "\n");
    lines.push_back("    " + std::string{text} + "\n");
    lines.push_back("    " + std::string(exc.colno() - 1, ' ') + std::string(carets, '^') + "\n");
    lines.push_back("jsonmanip_cpp::SyntaxError: " + exc.msg() + "\n");
    return lines;
}

}  // namespace jsonmanip_cpp
