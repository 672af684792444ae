/*

mailbox_tree.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <imapxx/imap/parser.hpp>
#include <imapxx/imap/types.hpp>

namespace imapxx::imap
{

/// Places a LIST/LSUB entry in the tree, creating missing parents on the way.
inline void insert_box(mailbox_tree& tree, const list_entry& entry)
{
    mailbox_tree* level = &tree;
    std::string_view rest = entry.name;
    std::string full_name;

    while (true)
    {
        std::string_view segment = rest;
        bool last = true;
        if (entry.delimiter)
        {
            const auto pos = rest.find(*entry.delimiter);
            if (pos != std::string_view::npos)
            {
                segment = rest.substr(0, pos);
                rest.remove_prefix(pos + 1);
                last = false;
            }
        }

        if (level != &tree)
            full_name += *entry.delimiter;
        full_name += segment;

        mailbox_node* node = nullptr;
        for (auto& candidate : *level)
        {
            if (candidate.name == segment)
            {
                node = &candidate;
                break;
            }
        }
        if (!node)
        {
            mailbox_node fresh;
            fresh.name = std::string(segment);
            fresh.full_name = full_name;
            fresh.delimiter = entry.delimiter;
            level->push_back(std::move(fresh));
            node = &level->back();
        }

        if (last)
        {
            node->attribs = entry.attribs;
            node->delimiter = entry.delimiter;
            return;
        }
        level = &node->children;
    }
}

[[nodiscard]] inline mailbox_tree build_mailbox_tree(const std::vector<list_entry>& entries)
{
    mailbox_tree tree;
    for (const auto& entry : entries)
        insert_box(tree, entry);
    return tree;
}

} // namespace imapxx::imap
