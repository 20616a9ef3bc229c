/**
 * @file printer.h
 * @ingroup ssdet_internal
 * @brief Console formatting for configuration dumps and per-layer anchor tables.
 *
 * @details
 * Two layouts are supported:
 * - aligned "key: value" rows (@ref ssdet::internal::Printer::kv and friends),
 * - fixed-width column tables (@ref ssdet::internal::Printer::header / @ref ssdet::internal::Printer::row).
 *
 * Colors are off unless explicitly enabled; output goes to whatever stream the caller owns.
 *
 * @note Internal header; not installed.
 */

#pragma once

#include <algorithm>
#include <initializer_list>
#include <iomanip>
#include <ostream>
#include <string>
#include <vector>

namespace ssdet::internal {

struct Ansi {
    bool enable = false;
    const char* reset() const noexcept {
        return enable ? "\033[0m" : "";
    }
    const char* dim() const noexcept {
        return enable ? "\033[2m" : "";
    }
    const char* bold() const noexcept {
        return enable ? "\033[1m" : "";
    }
    const char* cyan() const noexcept {
        return enable ? "\033[36m" : "";
    }
    const char* green() const noexcept {
        return enable ? "\033[32m" : "";
    }
    const char* red() const noexcept {
        return enable ? "\033[31m" : "";
    }
};

struct Printer {
    std::ostream& os;
    Ansi a{};
    int key_w = 22;

    /// Column widths of the current table (set by @ref header).
    std::vector<int> cols{};

    void section(const std::string& title, int indent = 0) {
        pad(indent);
        os << a.bold() << title << ":" << a.reset() << "\n";
    }

    template <class T> void kv(const std::string& key, const T& value, int indent = 0) {
        const auto flags = os.flags();
        pad(indent);
        os << std::left << std::setw(key_w) << (key + ":") << value << "\n";
        os.flags(flags);
    }

    void kv_bool(const std::string& key, bool v, int indent = 0) {
        const auto flags = os.flags();
        pad(indent);
        os << std::left << std::setw(key_w) << (key + ":") << (v ? a.green() : a.red()) << (v ? "true" : "false")
           << a.reset() << "\n";
        os.flags(flags);
    }

    /// Empty paths print as a dimmed "(empty)".
    void kv_path(const std::string& key, const std::string& path, int indent = 0) {
        const auto flags = os.flags();
        pad(indent);
        os << std::left << std::setw(key_w) << (key + ":");
        if (path.empty())
            os << a.dim() << "(empty)" << a.reset() << "\n";
        else
            os << a.cyan() << path << a.reset() << "\n";
        os.flags(flags);
    }

    void hint(const std::string& msg, int indent = 0) {
        pad(indent);
        os << a.dim() << msg << a.reset() << "\n";
    }

    /**
     * @brief Starts a table: prints the column titles and remembers their widths.
     *
     * Each width is max(title length + 2, @p min_w).
     */
    void header(std::initializer_list<const char*> titles, int indent = 0, int min_w = 10) {
        const auto flags = os.flags();
        cols.clear();
        pad(indent);
        os << a.dim();
        for (const char* t : titles) {
            const int w = std::max((int)std::char_traits<char>::length(t) + 2, min_w);
            cols.push_back(w);
            os << std::left << std::setw(w) << t;
        }
        os << a.reset() << "\n";
        os.flags(flags);
    }

    /**
     * @brief Prints one table row; floating values use @p precision significant digits.
     *
     * Extra values beyond the header's column count are written unpadded.
     */
    template <class... Ts> void row(int indent, int precision, const Ts&... values) {
        const auto flags = os.flags();
        const auto prec = os.precision(precision);
        pad(indent);
        std::size_t c = 0;
        ((os << std::left << std::setw(c < cols.size() ? cols[c] : 0) << values, ++c), ...);
        os << "\n";
        os.precision(prec);
        os.flags(flags);
    }

  private:
    void pad(int indent) {
        for (int i = 0; i < indent; ++i)
            os.put(' ');
    }
};

} // namespace ssdet::internal
