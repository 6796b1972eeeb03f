// conl_core.hpp - CONL - Core Data Structures
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef CONL_CORE_HPP
#define CONL_CORE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <optional>
#include <algorithm>
#include <cstdint>

namespace conl
{
//========================================================================
// Source locations and error records
//========================================================================

    inline constexpr size_t npos() { return static_cast<size_t>(-1); }

    struct source_location
    {
        size_t line = 0;    // 1-based, 0 for the document itself
    };

    template <typename Kind>
    struct error
    {
        Kind            kind;
        source_location loc;
        std::string     message;
    };

//========================================================================
// Generation context
//========================================================================

    template <typename T, typename Error>
    struct context
    {
        T result;
        std::vector<Error> errors;

        bool has_errors() const { return !errors.empty(); }
    };

//========================================================================
// UTILITY FUNCTIONS
//========================================================================

    namespace detail
    {
        constexpr std::string_view HORIZONTAL_WS = " \t";

        inline std::string_view trim_left(std::string_view s, std::string_view chars = HORIZONTAL_WS)
        {
            size_t start = s.find_first_not_of(chars);
            if (start == std::string_view::npos) return {};
            return s.substr(start);
        }

        inline std::string_view trim_right(std::string_view s, std::string_view chars = HORIZONTAL_WS)
        {
            size_t end = s.find_last_not_of(chars);
            if (end == std::string_view::npos) return {};
            return s.substr(0, end + 1);
        }

        inline bool is_hex_digit(char c)
        {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        }

        // Length of the UTF-8 sequence introduced by the lead byte, 0 if invalid.
        inline size_t utf8_sequence_length(unsigned char lead)
        {
            if (lead < 0x80) return 1;
            if ((lead >> 5) == 0x06) return 2;
            if ((lead >> 4) == 0x0e) return 3;
            if ((lead >> 3) == 0x1e) return 4;
            return 0;
        }

        inline bool valid_utf8(std::string_view s)
        {
            size_t i = 0;
            while (i < s.size())
            {
                auto lead = static_cast<unsigned char>(s[i]);
                size_t len = utf8_sequence_length(lead);
                if (len == 0 || i + len > s.size())
                    return false;

                uint32_t cp = len == 1 ? lead
                            : len == 2 ? (lead & 0x1fu)
                            : len == 3 ? (lead & 0x0fu)
                            :            (lead & 0x07u);

                for (size_t k = 1; k < len; ++k)
                {
                    auto cont = static_cast<unsigned char>(s[i + k]);
                    if ((cont >> 6) != 0x02)
                        return false;
                    cp = (cp << 6) | (cont & 0x3fu);
                }

                // overlong forms, surrogates and out-of-range code points
                if ((len == 2 && cp < 0x80) ||
                    (len == 3 && cp < 0x800) ||
                    (len == 4 && cp < 0x10000) ||
                    (cp >= 0xd800 && cp <= 0xdfff) ||
                    cp > 0x10ffff)
                    return false;

                i += len;
            }
            return true;
        }

        inline bool valid_code_point(uint32_t cp)
        {
            return cp <= 0x10ffff && !(cp >= 0xd800 && cp <= 0xdfff);
        }

        inline void append_utf8(std::string& out, uint32_t cp)
        {
            if (cp < 0x80)
            {
                out += static_cast<char>(cp);
            }
            else if (cp < 0x800)
            {
                out += static_cast<char>(0xc0 | (cp >> 6));
                out += static_cast<char>(0x80 | (cp & 0x3f));
            }
            else if (cp < 0x10000)
            {
                out += static_cast<char>(0xe0 | (cp >> 12));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
                out += static_cast<char>(0x80 | (cp & 0x3f));
            }
            else
            {
                out += static_cast<char>(0xf0 | (cp >> 18));
                out += static_cast<char>(0x80 | ((cp >> 12) & 0x3f));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
                out += static_cast<char>(0x80 | (cp & 0x3f));
            }
        }

        // "a", "a or b", "a, b or c"
        inline std::string join_with_or(std::vector<std::string> const & items)
        {
            std::string out;
            for (size_t i = 0; i < items.size(); ++i)
            {
                if (i > 0)
                    out += (i + 1 == items.size()) ? " or " : ", ";
                out += items[i];
            }
            return out;
        }

        inline void sort_unique(std::vector<std::string>& items)
        {
            std::sort(items.begin(), items.end());
            items.erase(std::unique(items.begin(), items.end()), items.end());
        }
    }

} // namespace conl

#endif // CONL_CORE_HPP
