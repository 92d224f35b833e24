#pragma once

#include "diagnostic.hpp"
#include "import_resolver.hpp"
#include "plugin_record.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace mex::discovery
{
    enum class ClassificationStatus
    {
        Classified,
        // `Class.steps`: the value comes from decorated methods of `decoratorClass`.
        NeedsDecoratorScan,
        Unsupported
    };

    struct Classification
    {
        ClassificationStatus status{ClassificationStatus::Classified};
        ClassifiedValue value;
        std::string decoratorClass;
        std::optional<Diagnostic> error;
    };

    class ValueClassifier
    {
    public:
        explicit ValueClassifier(const SymbolTable& symbols);

        [[nodiscard]] Classification classify(std::string_view rawValue) const;

    private:
        const SymbolTable& m_symbols;
    };

    [[nodiscard]] std::optional<std::string_view> lookupEnumValue(std::string_view expression);
} // namespace mex::discovery
