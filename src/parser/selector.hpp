#pragma once
#include <string>
#include <vector>
#include "../core/types/errors.hpp"
#include "html_document.hpp"

namespace Vortex {
namespace Parsing {

class SelectorError : public Core::ConfigError {
public:
    using Core::ConfigError::ConfigError;
};

/**
 * @brief Compiled CSS selector over gumbo elements.
 *
 * Supported: type and universal selectors, #id, .class, attribute tests
 * ([a], [a=v], [a~=v], [a^=v], [a$=v], [a*=v], quoted or bare values),
 * descendant and child combinators, and comma-separated groups.
 * Pseudo-classes and sibling combinators are rejected with SelectorError.
 */
class Selector {
public:
    struct AttributeTest {
        enum class Op { Exists, Equals, Includes, Prefix, Suffix, Contains };

        std::string name;
        Op          op = Op::Exists;
        std::string value;
    };

    struct Compound {
        std::string                tag;  // empty: any
        std::string                id;
        std::vector<std::string>   classes;
        std::vector<AttributeTest> attributes;
    };

    // parts[i] and parts[i + 1] are joined by combinators[i] (' ' or '>').
    struct Complex {
        std::vector<Compound> parts;
        std::vector<char>     combinators;
    };

    static Selector parse(const std::string& css);

    bool               matches(const Element& element) const;
    const std::string& source() const {
        return source_;
    }

private:
    static bool matches_compound(const Compound& compound, const Element& element);
    static bool matches_from(const Complex& complex, size_t index, const Element& element);

    std::string          source_;
    std::vector<Complex> groups_;
};

}  // namespace Parsing
}  // namespace Vortex
