#include "value_classifier.hpp"
#include "source_text.hpp"

#include <array>
#include <utility>

namespace mex::discovery
{
    namespace
    {
        struct EnumEntry
        {
            std::string_view expression;
            std::string_view value;
        };

        constexpr std::array<EnumEntry, 3> kEnumValues{{
            {"IOType.STDOUT", "stdout"},
            {"IOType.STDIN", "stdin"},
            {"IOType.BOTH", "both"},
        }};

        constexpr std::string_view kStepsAttribute = ".steps";

        Classification classified(ClassifiedValue value)
        {
            Classification result;
            result.value = std::move(value);
            return result;
        }

        ClassifiedValue makeValue(ValueKind kind, std::string text = {})
        {
            ClassifiedValue value;
            value.kind = kind;
            value.text = std::move(text);
            return value;
        }

        // Leading dotted name of `value`, e.g. `Config.from_file` of
        // `Config.from_file("x")`. Empty when `value` does not start with a name.
        std::string_view leadingDottedName(std::string_view value)
        {
            std::size_t end = 0;
            std::size_t index = 0;
            while (index < value.size())
            {
                const std::size_t segmentStart = index;
                if (value[index] >= '0' && value[index] <= '9')
                {
                    break;
                }
                while (index < value.size() && isIdentifierChar(value[index]))
                {
                    ++index;
                }
                if (index == segmentStart)
                {
                    break;
                }

                end = index;
                if (index >= value.size() || value[index] != '.')
                {
                    break;
                }
                ++index;
            }
            return value.substr(0, end);
        }

        Classification unsupportedAttribute(std::string_view value)
        {
            Classification result;
            result.status = ClassificationStatus::Unsupported;
            result.error = makeError("MEX-E2400",
                ErrorKind::UnsupportedConstruct,
                "Attribute access '" + std::string{value} + "' cannot be evaluated statically.");
            return result;
        }
    } // namespace

    std::optional<std::string_view> lookupEnumValue(std::string_view expression)
    {
        for (const auto& entry : kEnumValues)
        {
            if (entry.expression == expression)
            {
                return entry.value;
            }
        }
        return std::nullopt;
    }

    ValueClassifier::ValueClassifier(const SymbolTable& symbols)
        : m_symbols(symbols)
    {
    }

    Classification ValueClassifier::classify(std::string_view rawValue) const
    {
        const std::string_view value = trim(rawValue);

        if (value.empty() || value == "None")
        {
            return classified(makeValue(ValueKind::Null));
        }

        if (value == "True" || value == "False")
        {
            ClassifiedValue boolean = makeValue(ValueKind::Boolean);
            boolean.boolean = value == "True";
            return classified(std::move(boolean));
        }

        if (isQuotedString(value))
        {
            return classified(makeValue(ValueKind::String, unquote(value)));
        }

        const std::string_view dottedName = leadingDottedName(value);
        if (dottedName.find('.') != std::string_view::npos)
        {
            if (dottedName.size() < value.size())
            {
                // Calls, subscripts and operators on an attribute.
                return unsupportedAttribute(value);
            }

            if (const auto enumValue = lookupEnumValue(value))
            {
                return classified(makeValue(ValueKind::String, std::string{*enumValue}));
            }

            if (value.size() > kStepsAttribute.size()
                && value.compare(value.size() - kStepsAttribute.size(), kStepsAttribute.size(), kStepsAttribute) == 0)
            {
                Classification result;
                result.status = ClassificationStatus::NeedsDecoratorScan;
                result.decoratorClass = std::string{value.substr(0, value.size() - kStepsAttribute.size())};
                return result;
            }

            return unsupportedAttribute(value);
        }

        if (value.front() == '[' && value.back() == ']')
        {
            return classified(makeValue(ValueKind::EmptyArray));
        }

        if (isIdentifier(value))
        {
            if (const SymbolBinding* binding = m_symbols.find(value))
            {
                ClassifiedValue reference = makeValue(ValueKind::CallableReference);
                reference.callable.modulePath = binding->modulePath;
                reference.callable.name = binding->originalName;
                reference.callable.kind = inferCallableKind(binding->originalName);
                return classified(std::move(reference));
            }
        }

        return classified(makeValue(ValueKind::Opaque, std::string{value}));
    }
} // namespace mex::discovery
