// conl_document.hpp - CONL - Document tree
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef CONL_DOCUMENT_HPP
#define CONL_DOCUMENT_HPP

#include "conl_tokens.hpp"

namespace conl
{
    struct entry;

    // At most one of scalar, map and list is populated. A node with none
    // of them is "no value".
    struct node
    {
        std::optional<token> scalar;
        std::vector<entry>   map;
        std::vector<entry>   list;

        bool is_scalar() const noexcept;
        bool is_map() const noexcept;
        bool is_list() const noexcept;
        bool empty() const noexcept;
    };

    // Map entries and list items alike. For list items the key token is
    // the list_item token and carries no content.
    struct entry
    {
        token  key;
        node   value;
        size_t parent_line = 0;   // line of the entry owning this one, 0 for the root
    };

    inline bool node::is_scalar() const noexcept { return scalar.has_value(); }
    inline bool node::is_map() const noexcept    { return !map.empty(); }
    inline bool node::is_list() const noexcept   { return !list.empty(); }
    inline bool node::empty() const noexcept     { return !scalar && map.empty() && list.empty(); }

//========================================================================
// Document
//========================================================================

    class document
    {
    public:
        document() = default;

        const node& root() const noexcept
        {
            return root_;
        }

        // Decode errors on tokens that do not become part of the tree
        // (comments and multiline hints).
        const std::vector<token>& detached_errors() const noexcept
        {
            return detached_;
        }

        // The entry whose key or list marker is on the given line.
        const entry* find_entry(size_t line) const noexcept;

        // The value introduced on the given line; line 0 is the root.
        const node* value_at(size_t line) const noexcept;

    private:
        node               root_;
        std::vector<token> detached_;

        friend struct document_builder;
    };

//========================================================================
// Builder
//========================================================================

    // Consumes a normalised token stream, one token at a time.
    struct document_builder
    {
        explicit document_builder(document& doc)
            : doc_(doc)
        {
            stack_.push_back(frame{ &doc_.root_, 0, nullptr });
        }

        void feed(token tok);

    private:
        struct frame
        {
            node*  container;
            size_t line;    // line of the entry owning the container
            entry* last;    // most recent entry in the container
        };

        void append(std::vector<entry>& into, token tok);

        document&          doc_;
        std::vector<frame> stack_;
        size_t             last_line_ = 0;
    };

    document parse_document(std::string_view input);

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        inline const entry* find_entry_in(const node& n, size_t line) noexcept
        {
            for (auto const * entries : { &n.map, &n.list })
            {
                for (auto const & e : *entries)
                {
                    if (e.key.line == line)
                        return &e;
                    if (auto found = find_entry_in(e.value, line))
                        return found;
                }
            }
            return nullptr;
        }
    }

    inline const entry* document::find_entry(size_t line) const noexcept
    {
        return detail::find_entry_in(root_, line);
    }

    inline const node* document::value_at(size_t line) const noexcept
    {
        if (line == 0)
            return &root_;

        auto e = find_entry(line);
        return e ? &e->value : nullptr;
    }

//---------------------------------------------------------------------------

    inline void document_builder::append(std::vector<entry>& into, token tok)
    {
        last_line_ = tok.line;
        into.push_back(entry{ std::move(tok), node{}, stack_.back().line });
        stack_.back().last = &into.back();
    }

    inline void document_builder::feed(token tok)
    {
        frame& top = stack_.back();

        switch (tok.kind)
        {
            case token_kind::map_key:
                append(top.container->map, std::move(tok));
                break;

            case token_kind::list_item:
                append(top.container->list, std::move(tok));
                break;

            case token_kind::scalar:
            case token_kind::multiline_scalar:
                if (top.last)
                {
                    top.last->value = node{};
                    top.last->value.scalar = std::move(tok);
                }
                else if (tok.has_error())
                {
                    doc_.detached_.push_back(std::move(tok));
                }
                break;

            case token_kind::indent:
            {
                node* container = top.container;
                if (top.last)
                {
                    top.last->value = node{};
                    container = &top.last->value;
                }
                stack_.push_back(frame{ container, last_line_, nullptr });
                break;
            }

            case token_kind::outdent:
                if (stack_.size() > 1)
                    stack_.pop_back();
                break;

            case token_kind::comment:
            case token_kind::multiline_hint:
                if (tok.has_error())
                    doc_.detached_.push_back(std::move(tok));
                break;

            case token_kind::no_value:
                break;
        }
    }

//---------------------------------------------------------------------------

    inline document parse_document(std::string_view input)
    {
        document doc;
        document_builder builder(doc);

        token_stream stream(input);
        while (auto tok = stream.next())
            builder.feed(std::move(*tok));

        return doc;
    }

} // namespace conl

#endif // CONL_DOCUMENT_HPP
