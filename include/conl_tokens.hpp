// conl_tokens.hpp - CONL - Normalised token stream
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// The raw lexer is post-processed so that, whatever the input:
//   * indent and outdent are always paired
//   * ignoring comments, a map key or list item is always followed by a
//     scalar, a multiline hint (and then a multiline scalar), an indent
//     or a synthesised no_value
//   * a section holds only map keys or only list items; an entry of the
//     other kind is replaced by an entry of the section's kind that
//     carries an error
// Errors are reported in token::error and scanning always continues.

#ifndef CONL_TOKENS_HPP
#define CONL_TOKENS_HPP

#include "conl_lexer.hpp"

namespace conl
{
    struct token_options
    {
        bool skip_trivia = false;   // drop comments and multiline hints
    };

//========================================================================
// Token stream
//========================================================================

    // Pull-based and single-pass: one token per next() call. The input
    // must outlive the stream.
    class token_stream
    {
    public:
        explicit token_stream(std::string_view input, token_options opts = {})
            : lexer_(input)
            , opts_(opts)
        {}

        std::optional<token> next();

    private:
        struct parse_state
        {
            std::optional<token_kind> kind;
            bool has_key = false;
        };

        void process(token tok);
        void finish();
        void push(token tok);

        lexer                    lexer_;
        token_options            opts_;
        std::vector<parse_state> states_ { parse_state{} };
        std::deque<token>        pending_;
        size_t                   last_line_ = 0;
        bool                     finished_  = false;
    };

    std::vector<token> tokenize(std::string_view input, token_options opts = {});

//========================================================================
// Implementation
//========================================================================

    inline std::optional<token> token_stream::next()
    {
        while (pending_.empty() && !finished_)
        {
            if (auto tok = lexer_.next())
                process(std::move(*tok));
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

    inline void token_stream::push(token tok)
    {
        if (opts_.skip_trivia &&
            (tok.kind == token_kind::comment || tok.kind == token_kind::multiline_hint))
            return;

        pending_.push_back(std::move(tok));
    }

//---------------------------------------------------------------------------

    inline void token_stream::process(token tok)
    {
        parse_state& state = states_.back();

        switch (tok.kind)
        {
            case token_kind::indent:
            {
                if (state.has_key)
                {
                    state.has_key = false;
                }
                else
                {
                    if (!state.kind)
                        state.kind = token_kind::map_key;
                    push(token{ *state.kind, {}, tok.line, std::string("unexpected indent") });
                }
                states_.push_back(parse_state{});
                break;
            }

            case token_kind::outdent:
            {
                bool had_key = state.has_key;
                if (states_.size() > 1)
                    states_.pop_back();
                if (had_key)
                    push(token{ token_kind::no_value, {}, tok.line, std::nullopt });
                break;
            }

            case token_kind::map_key:
            case token_kind::list_item:
            {
                if (!state.kind)
                    state.kind = tok.kind;

                if (state.has_key)
                    push(token{ token_kind::no_value, {}, tok.line, std::nullopt });
                state.has_key = true;

                if (*state.kind != tok.kind)
                {
                    std::string message = *state.kind == token_kind::map_key
                        ? "unexpected list item"
                        : "unexpected map key";
                    push(token{ *state.kind, {}, tok.line, std::move(message) });
                    return;
                }
                break;
            }

            case token_kind::scalar:
            case token_kind::multiline_scalar:
                state.has_key = false;
                break;

            case token_kind::comment:
            case token_kind::multiline_hint:
            case token_kind::no_value:
                break;
        }

        last_line_ = tok.line;
        push(std::move(tok));
    }

//---------------------------------------------------------------------------

    inline void token_stream::finish()
    {
        finished_ = true;

        while (!states_.empty())
        {
            if (states_.back().has_key)
                push(token{ token_kind::no_value, {}, last_line_, std::nullopt });
            if (states_.size() > 1)
                push(token{ token_kind::outdent, {}, last_line_, std::nullopt });
            states_.pop_back();
        }
    }

//---------------------------------------------------------------------------

    inline std::vector<token> tokenize(std::string_view input, token_options opts)
    {
        std::vector<token> out;
        token_stream stream(input, opts);
        while (auto tok = stream.next())
            out.push_back(std::move(*tok));
        return out;
    }

} // namespace conl

#endif // CONL_TOKENS_HPP
