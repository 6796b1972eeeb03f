// conl_lexer.hpp - CONL - Scanner and raw Lexer
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef CONL_LEXER_HPP
#define CONL_LEXER_HPP

#include "conl_core.hpp"
#include <deque>

namespace conl
{
//========================================================================
// Tokens
//========================================================================

    enum class token_kind
    {
        comment,
        indent,
        outdent,
        map_key,
        list_item,
        scalar,
        no_value,
        multiline_scalar,
        multiline_hint
    };

    inline std::string_view to_string(token_kind kind)
    {
        switch (kind)
        {
            case token_kind::comment:          return "Comment";
            case token_kind::indent:           return "Indent";
            case token_kind::outdent:          return "Outdent";
            case token_kind::map_key:          return "MapKey";
            case token_kind::list_item:        return "ListItem";
            case token_kind::scalar:           return "Scalar";
            case token_kind::no_value:         return "NoValue";
            case token_kind::multiline_scalar: return "MultilineScalar";
            case token_kind::multiline_hint:   return "MultilineHint";
        }
        return "Unknown";
    }

    // A token with an error is still part of the stream; the error
    // describes why its content could not be decoded.
    struct token
    {
        token_kind  kind = token_kind::comment;
        std::string content;
        size_t      line = 0;
        std::optional<std::string> error;

        bool has_error() const { return error.has_value(); }
    };

//========================================================================
// Scanner
//========================================================================

    namespace detail
    {
        // Splits on "\r\n", "\r" and "\n". Always yields at least one line.
        struct line_reader
        {
            std::string_view rest;
            size_t           line = 0;
            bool             done = false;

            bool next(std::string_view& out)
            {
                if (done)
                    return false;

                ++line;
                size_t brk = rest.find_first_of("\r\n");
                if (brk == std::string_view::npos)
                {
                    out  = rest;
                    done = true;
                    return true;
                }

                out = rest.substr(0, brk);
                size_t skip = (rest[brk] == '\r' && brk + 1 < rest.size() && rest[brk + 1] == '\n') ? 2 : 1;
                rest.remove_prefix(brk + skip);
                return true;
            }
        };

        struct literal_split
        {
            std::string_view literal;
            std::string_view after;
        };

        inline literal_split split_unquoted(std::string_view input, bool key)
        {
            if (key)
            {
                if (size_t eq = input.find('='); eq != std::string_view::npos)
                {
                    std::string_view before = input.substr(0, eq);
                    if (size_t semi = before.find(';'); semi != std::string_view::npos)
                        return { trim_right(before.substr(0, semi)), input.substr(semi) };
                    return { trim_right(before), input.substr(eq + 1) };
                }
            }

            if (size_t semi = input.find(';'); semi != std::string_view::npos)
                return { trim_right(input.substr(0, semi)), input.substr(semi) };

            return { trim_right(input), {} };
        }

        // Index of the quote closing the literal opened at input[0], or npos.
        inline size_t closing_quote(std::string_view input)
        {
            size_t i = 1;
            while (i < input.size())
            {
                if (input[i] == '\\')
                {
                    i += 2;
                    continue;
                }
                if (input[i] == '"')
                    return i;
                ++i;
            }
            return std::string_view::npos;
        }

        // Splits the leading literal (quoted or bare) off the input. In key
        // position a bare literal also stops at the first unquoted '='.
        inline literal_split split_literal(std::string_view input, bool key)
        {
            if (!input.starts_with('"'))
                return split_unquoted(input, key);

            size_t close = closing_quote(input);
            if (close == std::string_view::npos)
                return { input, {} };

            auto tail = split_unquoted(input.substr(close), key);
            return { input.substr(0, close + tail.literal.size()), tail.after };
        }

        inline std::optional<std::string> check_utf8(std::string_view s)
        {
            if (!valid_utf8(s))
                return std::string("invalid UTF-8");
            return std::nullopt;
        }

        struct decoded
        {
            std::string text;
            std::optional<std::string> error;
        };

        inline decoded decode_failure(std::string message)
        {
            return { {}, std::move(message) };
        }

        inline decoded decode_literal(std::string_view input)
        {
            if (!valid_utf8(input))
                return decode_failure("invalid UTF-8");

            if (!input.starts_with('"'))
                return { std::string(input), std::nullopt };

            size_t close = closing_quote(input);
            if (close == std::string_view::npos)
                return decode_failure("unclosed quotes");
            if (close + 1 != input.size())
                return decode_failure("characters after quotes");

            std::string_view body = input.substr(1, close - 1);
            std::string out;
            out.reserve(body.size());

            size_t i = 0;
            while (i < body.size())
            {
                if (body[i] != '\\')
                {
                    out += body[i++];
                    continue;
                }

                char code = body[i + 1];
                switch (code)
                {
                    case 'n':  out += '\n'; i += 2; continue;
                    case 'r':  out += '\r'; i += 2; continue;
                    case 't':  out += '\t'; i += 2; continue;
                    case '"':  out += '"';  i += 2; continue;
                    case '\\': out += '\\'; i += 2; continue;
                    default: break;
                }

                std::string_view escape;
                if (code == '{')
                {
                    size_t end = body.find('}', i + 2);
                    escape = end == std::string_view::npos ? body.substr(i) : body.substr(i, end - i + 1);

                    if (end != std::string_view::npos)
                    {
                        std::string_view hex = body.substr(i + 2, end - i - 2);
                        bool ok = !hex.empty() && hex.size() <= 8 &&
                                  std::all_of(hex.begin(), hex.end(), is_hex_digit);
                        if (ok)
                        {
                            uint32_t cp = 0;
                            for (char h : hex)
                                cp = cp * 16 + static_cast<uint32_t>(
                                    h <= '9' ? h - '0' : (h | 0x20) - 'a' + 10);

                            if (valid_code_point(cp))
                            {
                                append_utf8(out, cp);
                                i = end + 1;
                                continue;
                            }
                        }
                    }
                }
                else
                {
                    size_t len = utf8_sequence_length(static_cast<unsigned char>(code));
                    escape = body.substr(i, 1 + (len == 0 ? 1 : len));
                }

                return decode_failure("invalid escape code: " + std::string(escape));
            }

            return { std::move(out), std::nullopt };
        }
    }

//========================================================================
// Lexer
//========================================================================

    // Raw tokenizer. Produces one token per next() call, line by line.
    // The input must outlive the lexer. Indent/Outdent are not balanced at
    // end of input; token_stream takes care of that.
    class lexer
    {
    public:
        explicit lexer(std::string_view input)
            : lines_{ input }
        {}

        std::optional<token> next();

    private:
        void scan_line(size_t lno, std::string_view content);
        bool capture_multiline(size_t lno, std::string_view indent,
                               std::string_view rest, std::string_view content);
        void finish();

        void emit(token_kind kind, size_t line, std::string content = {},
                  std::optional<std::string> error = std::nullopt);
        void emit_comment(size_t line, std::string_view text);
        void emit_multiline(size_t line);

        detail::line_reader      lines_;
        std::deque<token>        pending_;
        std::vector<std::string> stack_ { std::string() };
        bool                     finished_ = false;

        // multiline capture
        bool        multiline_ = false;
        std::string multiline_prefix_;
        std::string multiline_value_;
        size_t      multiline_line_ = 0;
    };

//---------------------------------------------------------------------------

    inline std::optional<token> lexer::next()
    {
        std::string_view content;
        while (pending_.empty() && !finished_)
        {
            if (lines_.next(content))
                scan_line(lines_.line, content);
            else
                finish();
        }

        if (pending_.empty())
            return std::nullopt;

        token out = std::move(pending_.front());
        pending_.pop_front();
        return out;
    }

//---------------------------------------------------------------------------

    inline void lexer::emit(token_kind kind, size_t line, std::string content,
                            std::optional<std::string> error)
    {
        pending_.push_back(token{ kind, std::move(content), line, std::move(error) });
    }

    inline void lexer::emit_comment(size_t line, std::string_view text)
    {
        emit(token_kind::comment, line, std::string(text), detail::check_utf8(text));
    }

    inline void lexer::emit_multiline(size_t line)
    {
        std::string_view value = detail::trim_right(multiline_value_, " \t\r\n");
        emit(token_kind::multiline_scalar, line, std::string(value), detail::check_utf8(value));
    }

//---------------------------------------------------------------------------

    // Returns true when the line belonged to the multiline value.
    inline bool lexer::capture_multiline(size_t lno, std::string_view indent,
                                         std::string_view rest, std::string_view content)
    {
        std::string const & top = stack_.back();

        if (multiline_prefix_.empty())
        {
            if (!rest.empty() && indent.starts_with(top) && indent.size() > top.size())
            {
                multiline_prefix_ = std::string(indent);
                multiline_value_  = std::string(rest);
                multiline_line_   = lno;
                return true;
            }
            if (rest.empty())
                return true;

            emit(token_kind::multiline_scalar, multiline_line_, {}, std::string("missing multiline value"));
            multiline_ = false;
            return false;
        }

        if (content.starts_with(multiline_prefix_))
        {
            multiline_value_ += '\n';
            multiline_value_ += content.substr(multiline_prefix_.size());
            return true;
        }
        if (rest.empty())
        {
            multiline_value_ += '\n';
            return true;
        }

        emit_multiline(multiline_line_);
        multiline_ = false;
        multiline_prefix_.clear();
        multiline_value_.clear();
        return false;
    }

//---------------------------------------------------------------------------

    inline void lexer::scan_line(size_t lno, std::string_view content)
    {
        std::string_view rest   = detail::trim_left(content);
        std::string_view indent = content.substr(0, content.size() - rest.size());

        if (multiline_ && capture_multiline(lno, indent, rest, content))
            return;

        if (rest.empty())
            return;

        if (rest.starts_with(';'))
        {
            emit_comment(lno, rest.substr(1));
            return;
        }

        while (!indent.starts_with(stack_.back()))
        {
            stack_.pop_back();
            emit(token_kind::outdent, lno);
        }

        if (indent != stack_.back())
        {
            stack_.push_back(std::string(indent));
            emit(token_kind::indent, lno, std::string(indent));
        }

        if (rest.starts_with('='))
        {
            rest = detail::trim_left(rest.substr(1));
            emit(token_kind::list_item, lno);
        }
        else
        {
            auto split = detail::split_literal(rest, true);
            auto key   = detail::decode_literal(split.literal);
            emit(token_kind::map_key, lno, std::move(key.text), std::move(key.error));

            rest = detail::trim_left(split.after);
            if (rest.starts_with('='))
                rest = detail::trim_left(rest.substr(1));
        }

        if (rest.starts_with(';'))
        {
            emit_comment(lno, rest.substr(1));
            return;
        }

        if (rest.starts_with("\"\"\""))
        {
            auto split = detail::split_literal(rest.substr(3), false);
            auto err   = detail::check_utf8(split.literal);
            if (split.literal.starts_with('"'))
                err = "characters after quotes";

            multiline_      = true;
            multiline_line_ = lno;
            emit(token_kind::multiline_hint, lno, std::string(split.literal), std::move(err));

            if (split.after.starts_with(';'))
                emit_comment(lno, split.after.substr(1));
            return;
        }

        auto split = detail::split_literal(rest, false);
        if (!split.literal.empty())
        {
            auto value = detail::decode_literal(split.literal);
            emit(token_kind::scalar, lno, std::move(value.text), std::move(value.error));
        }

        if (split.after.starts_with(';'))
            emit_comment(lno, split.after.substr(1));
    }

//---------------------------------------------------------------------------

    inline void lexer::finish()
    {
        finished_ = true;
        if (!multiline_)
            return;

        if (!multiline_value_.empty())
            emit_multiline(multiline_line_);
        else
            emit(token_kind::multiline_scalar, multiline_line_, {}, std::string("missing multiline value"));

        multiline_ = false;
    }

} // namespace conl

#endif // CONL_LEXER_HPP
