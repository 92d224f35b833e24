#pragma once

#include "diagnostic.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mex::discovery
{
    // Where registrations live: the body of `functionName`, and for the
    // textual strategy the list bound to `listKeyword` inside it.
    struct RegistrationConvention
    {
        std::string functionName{"register_plugin"};
        std::string listKeyword{"plugins"};
    };

    struct LocatedCall
    {
        std::string callee;
        // Callee through the matching ')'.
        std::string text;
        std::size_t offset{0};
    };

    struct CallLocatorResult
    {
        std::vector<LocatedCall> calls;
        std::optional<Diagnostic> error;
    };

    enum class LocatorStrategy
    {
        Automatic,
        SyntaxTree,
        Textual
    };

    [[nodiscard]] std::string_view toString(LocatorStrategy strategy);
    [[nodiscard]] std::optional<LocatorStrategy> parseLocatorStrategy(std::string_view text);

    class CallLocator
    {
    public:
        virtual ~CallLocator() = default;

        // Registration calls in file order. An empty sequence is never a
        // success: it is reported as a NotFound error.
        [[nodiscard]] virtual CallLocatorResult locate(std::string_view source) const = 0;
        [[nodiscard]] virtual std::string_view strategyName() const noexcept = 0;
    };

    class SyntaxTreeCallLocator final : public CallLocator
    {
    public:
        explicit SyntaxTreeCallLocator(RegistrationConvention convention = {});

        [[nodiscard]] CallLocatorResult locate(std::string_view source) const override;
        [[nodiscard]] std::string_view strategyName() const noexcept override;

    private:
        RegistrationConvention m_convention;
    };

    class TextualCallLocator final : public CallLocator
    {
    public:
        explicit TextualCallLocator(RegistrationConvention convention = {});

        [[nodiscard]] CallLocatorResult locate(std::string_view source) const override;
        [[nodiscard]] std::string_view strategyName() const noexcept override;

    private:
        [[nodiscard]] std::optional<std::size_t> findFunctionDefinition(std::string_view source) const;
        [[nodiscard]] std::optional<std::size_t> findListOpening(std::string_view body) const;

        RegistrationConvention m_convention;
    };
} // namespace mex::discovery
