#pragma once

#include "../frontend/ast.hpp"
#include "../frontend/lexer.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mview::expander
{
    using frontend::Diagnostic;
    using frontend::SourceSpan;

    struct ExpanderOptions
    {
        // Path of the runtime crate that provides `html`, `ev`, `Fragment`
        // and the component builders.
        std::string cratePath{"leptos"};
    };

    /// Lowers a parsed template into one builder-call expression.
    ///
    /// Expansion stops at the first error; `expand` then returns
    /// `std::nullopt` and the error is the last entry of `diagnostics()`.
    class Expander
    {
    public:
        explicit Expander(ExpanderOptions options = {});

        [[nodiscard]] std::optional<std::string> expand(const frontend::Children& roots);
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        std::optional<std::string> expandChild(const frontend::Child& child);
        std::optional<std::string> expandElement(const frontend::Element& element);
        std::optional<std::string> expandHtmlElement(const frontend::Element& element);
        std::optional<std::string> expandComponent(const frontend::Element& element);
        std::optional<std::string> expandSlot(const frontend::Element& element);
        std::optional<std::string> expandFragment(const std::vector<const frontend::Child*>& children);
        std::string expandValue(const frontend::Value& value) const;

        std::optional<std::string> applyHtmlAttribute(const frontend::Attribute& attribute);
        std::optional<std::string> applyProperty(const frontend::Element& element,
                                                 const frontend::Attribute& attribute,
                                                 std::string& chained,
                                                 std::vector<std::string>& clones);
        std::optional<std::string> applyProperties(const frontend::Element& element, std::string& chained);
        std::optional<std::string> componentChildren(const frontend::Element& element,
                                                     const std::vector<std::string>& clones);

        bool checkNoSelectorShorthand(const frontend::Element& element);
        void emitError(const std::string& code, const std::string& message, SourceSpan span);

    private:
        ExpanderOptions m_options;
        std::vector<Diagnostic> m_diagnostics;
    };
} // namespace mview::expander
