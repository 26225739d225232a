#ifndef MARKDOWN_ACADEMIC_MDA_AST_HPP
#define MARKDOWN_ACADEMIC_MDA_AST_HPP

#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "common/meta.hpp"

#include "mda/environment_kind.hpp"
#include "mda/fwd.hpp"

namespace markdown_academic::mda {

/// @brief The horizontal alignment of a table column.
enum struct Alignment : Default_Underlying { left, center, right };

/// @brief How a citation is meant to be rendered.
enum struct Citation_Style : Default_Underlying {
    /// @brief `[@key]`, rendered as "(Author, Year)".
    parenthetical,
    /// @brief `@key`, rendered as "Author (Year)".
    textual,
    /// @brief `@key-`, rendered as "Author".
    author_only,
    /// @brief `[-@key]`, rendered as "(Year)".
    year_only,
};

[[nodiscard]] std::string_view alignment_name(Alignment alignment);
[[nodiscard]] std::string_view citation_style_name(Citation_Style style);

namespace ast {

// INLINE NODES ====================================================================================

struct Text {
    std::pmr::string text;
};

struct Emphasis {
    std::pmr::vector<Inline> content;
};

struct Strong {
    std::pmr::vector<Inline> content;
};

struct Strikethrough {
    std::pmr::vector<Inline> content;
};

struct Subscript {
    std::pmr::vector<Inline> content;
};

struct Superscript {
    std::pmr::vector<Inline> content;
};

struct Small_Caps {
    std::pmr::vector<Inline> content;
};

struct Code {
    std::pmr::string code;
};

struct Link {
    std::pmr::string url;
    std::optional<std::pmr::string> title;
    std::pmr::vector<Inline> content;
};

struct Image {
    std::pmr::string url;
    std::pmr::string alt;
    std::optional<std::pmr::string> title;
};

struct Inline_Math {
    /// @brief The raw LaTeX source between the delimiters.
    std::pmr::string source;
};

struct Citation {
    std::pmr::vector<std::pmr::string> keys;
    Citation_Style style;
    std::optional<std::pmr::string> prefix;
    std::optional<std::pmr::string> locator;
};

/// @brief A cross-reference `@label`.
/// `resolved` stays empty until reference resolution runs, which fills it exactly once.
struct Reference {
    std::pmr::string label;
    std::optional<std::pmr::string> resolved;
};

/// @brief Either an inline footnote `^[content]`, in which case `id` is empty,
/// or a reference `[^id]` to a footnote definition, in which case `content` is empty.
struct Footnote {
    std::optional<std::pmr::string> id;
    std::pmr::vector<Inline> content;

    [[nodiscard]] bool is_inline() const
    {
        return !id.has_value();
    }
};

struct Soft_Break { };

struct Hard_Break { };

struct Inline_Html {
    std::pmr::string html;
};

struct Inline : std::variant<Text,
                             Emphasis,
                             Strong,
                             Strikethrough,
                             Subscript,
                             Superscript,
                             Small_Caps,
                             Code,
                             Link,
                             Image,
                             Inline_Math,
                             Citation,
                             Reference,
                             Footnote,
                             Soft_Break,
                             Hard_Break,
                             Inline_Html> {
    using variant::variant;
};

// BLOCK NODES =====================================================================================

struct Paragraph {
    std::pmr::vector<Inline> content;
};

struct Heading {
    /// @brief The level in range `[1, 6]`.
    int level;
    std::pmr::vector<Inline> content;
    std::optional<std::pmr::string> label;
};

struct Code_Block {
    std::optional<std::pmr::string> language;
    std::pmr::string code;
};

struct Block_Quote {
    std::pmr::vector<Block> content;
};

struct List_Item {
    std::pmr::vector<Block> content;
    /// @brief For task list items `- [x]` and `- [ ]`, whether the box is checked.
    std::optional<bool> checked;
};

struct List {
    bool ordered;
    std::optional<Uint64> start;
    std::pmr::vector<List_Item> items;
};

struct Thematic_Break { };

struct Display_Math {
    std::pmr::string source;
    std::optional<std::pmr::string> label;
};

struct Environment {
    Environment_Kind kind;
    std::optional<std::pmr::string> label;
    std::pmr::vector<Block> content;
    std::optional<std::pmr::vector<Inline>> caption;
};

struct Table_Of_Contents { };

struct Html_Block {
    std::pmr::string html;
};

using Table_Cell = std::pmr::vector<Inline>;
using Table_Row = std::pmr::vector<Table_Cell>;

struct Table {
    Table_Row headers;
    std::pmr::vector<Alignment> alignments;
    std::pmr::vector<Table_Row> rows;
    std::optional<std::pmr::string> label;
    std::optional<std::pmr::vector<Inline>> caption;
};

struct Description_Item {
    std::pmr::vector<Inline> term;
    std::pmr::vector<Block> details;
};

struct Description_List {
    std::pmr::vector<Description_Item> items;
};

struct Page_Break { };

struct Abstract {
    std::pmr::vector<Block> content;
};

struct Appendix_Marker { };

/// @brief A footnote definition `[^id]: content`.
struct Footnote_Definition {
    std::pmr::string id;
    std::pmr::vector<Inline> content;
};

struct Block : std::variant<Paragraph,
                            Heading,
                            Code_Block,
                            Block_Quote,
                            List,
                            Thematic_Break,
                            Display_Math,
                            Environment,
                            Table_Of_Contents,
                            Html_Block,
                            Table,
                            Description_List,
                            Page_Break,
                            Abstract,
                            Appendix_Marker,
                            Footnote_Definition> {
    using variant::variant;
};

/// @brief Returns the name of the node type, such as `"Paragraph"`.
[[nodiscard]] std::string_view get_node_name(const Block& block);
[[nodiscard]] std::string_view get_node_name(const Inline& node);

/// @brief Returns the label of the block, if it is of a label-bearing type and has a label.
[[nodiscard]] const std::optional<std::pmr::string>* get_label(const Block& block);

/// @brief Appends the text content of `content` to `out`, dropping all formatting.
/// Math and code are included verbatim, references as their resolved text if any,
/// and breaks as a single space.
void append_plain_text(std::pmr::string& out, std::span<const Inline> content);

[[nodiscard]] std::pmr::string to_plain_text(std::span<const Inline> content,
                                             std::pmr::memory_resource* memory);

// VISITOR =========================================================================================

/// @brief Walks the tree depth-first in document order.
/// The default `visit` overloads simply recurse into the children;
/// derived visitors override them and call `visit_children` to continue the walk.
template <bool constant>
struct Visitor_Impl {
    using Block_Type = const_if_t<Block, constant>;
    using Inline_Type = const_if_t<Inline, constant>;

    virtual ~Visitor_Impl() = default;

    virtual void visit(Block_Type& block)
    {
        visit_children(block);
    }

    virtual void visit(Inline_Type& node)
    {
        visit_children(node);
    }

    void visit_blocks(std::span<Block_Type> blocks)
    {
        for (Block_Type& block : blocks) {
            this->visit(block);
        }
    }

    void visit_inlines(std::span<Inline_Type> inlines)
    {
        for (Inline_Type& node : inlines) {
            this->visit(node);
        }
    }

    void visit_children(Block_Type& block)
    {
        std::visit(
            [this]<typename T>(T& b) {
                using Node = std::remove_const_t<T>;
                if constexpr (std::is_same_v<Node, Paragraph> || std::is_same_v<Node, Heading>
                              || std::is_same_v<Node, Footnote_Definition>) {
                    visit_inlines(b.content);
                }
                else if constexpr (std::is_same_v<Node, Block_Quote>
                                   || std::is_same_v<Node, Abstract>) {
                    visit_blocks(b.content);
                }
                else if constexpr (std::is_same_v<Node, List>) {
                    for (auto& item : b.items) {
                        visit_blocks(item.content);
                    }
                }
                else if constexpr (std::is_same_v<Node, Environment>) {
                    visit_blocks(b.content);
                    if (b.caption) {
                        visit_inlines(*b.caption);
                    }
                }
                else if constexpr (std::is_same_v<Node, Table>) {
                    for (auto& cell : b.headers) {
                        visit_inlines(cell);
                    }
                    for (auto& row : b.rows) {
                        for (auto& cell : row) {
                            visit_inlines(cell);
                        }
                    }
                    if (b.caption) {
                        visit_inlines(*b.caption);
                    }
                }
                else if constexpr (std::is_same_v<Node, Description_List>) {
                    for (auto& item : b.items) {
                        visit_inlines(item.term);
                        visit_blocks(item.details);
                    }
                }
            },
            block);
    }

    void visit_children(Inline_Type& node)
    {
        std::visit(
            [this]<typename T>(T& n) {
                if constexpr (requires { n.content; }) {
                    visit_inlines(n.content);
                }
            },
            node);
    }
};

using Visitor = Visitor_Impl<false>;
using Const_Visitor = Visitor_Impl<true>;

} // namespace ast

} // namespace markdown_academic::mda

#endif
