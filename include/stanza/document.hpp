#pragma once


/*
    --------------------------------------------
    Stanza::document - Parsed, immutable JSON text
    --------------------------------------------
    A `document` owns the JSON text and the structural index built from
    it. Both are created once by `Stanza::parse(...)` and never change.
    Copying a `document` copies a reference-counted handle, not the text;
    nodes obtained from any copy stay valid while at least one copy lives.

    A default-constructed document is *absent*: its root node does not
    exist and every access through it yields defaults.
*/

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

#include "stanza/config.hpp"
#include "stanza/node.hpp"

namespace Stanza {

    /// @ingroup StanzaNode
    /// @brief Shared handle to an immutable parsed JSON document
    class document {
    public:
        /// @brief Constructs an absent document
        document() noexcept = default;

        /// @brief Internal constructor used by the parser
        explicit document(std::shared_ptr<const detail::document_data> data) noexcept
            : m_Data{ std::move(data) } {}

        /// @brief True if the document holds a parsed value
        [[nodiscard]] bool valid() const noexcept { return m_Data != nullptr && !m_Data->entries.empty(); }

        /// @brief Root value; absent for an absent document
        [[nodiscard]] node root() const noexcept { return valid() ? node{ m_Data.get(), 0 } : node{}; }

        /// @brief Shorthand for `root().get_path(path)`
        [[nodiscard]] node get_path(std::string_view path) const { return root().get_path(path); }

        /// @brief The JSON text the document was parsed from
        [[nodiscard]] std::string_view text() const noexcept { return m_Data ? std::string_view{ m_Data->text } : std::string_view{}; }

        /// @brief Process-unique identity of the parsed data, 0 if absent
        [[nodiscard]] std::uint64_t id() const noexcept { return m_Data ? m_Data->id : 0; }

        /// @brief Number of values recorded in the structural index
        [[nodiscard]] std::size_t value_count() const noexcept { return m_Data ? m_Data->entries.size() : 0; }

        /// @brief The shared index data, for components that store indexes
        [[nodiscard]] const detail::document_data* data() const noexcept { return m_Data.get(); }

    private:
        std::shared_ptr<const detail::document_data> m_Data{};
    };

} // namespace Stanza
