#include "selector.hpp"
#include <algorithm>
#include <cctype>
#include "../utils/text/string_utils.hpp"

namespace Vortex {
namespace Parsing {

namespace {

class SelectorParser {
public:
    explicit SelectorParser(const std::string& css) : s_(css) {
    }

    std::vector<Selector::Complex> parse() {
        std::vector<Selector::Complex> groups;
        skip_ws();
        if (eof())
            fail("empty selector");

        while (true) {
            groups.push_back(parse_complex());
            skip_ws();
            if (eof())
                break;
            expect(',');
            skip_ws();
        }
        return groups;
    }

private:
    const std::string& s_;
    size_t             pos_ = 0;

    [[noreturn]] void fail(const std::string& what) const {
        throw SelectorError("Invalid selector '" + s_ + "': " + what + " at position "
                            + std::to_string(pos_));
    }

    bool eof() const {
        return pos_ >= s_.size();
    }
    char peek() const {
        return eof() ? '\0' : s_[pos_];
    }

    bool skip_ws() {
        size_t start = pos_;
        while (!eof() && std::isspace(static_cast<unsigned char>(s_[pos_])))
            pos_++;
        return pos_ != start;
    }

    void expect(char c) {
        if (peek() != c)
            fail(std::string("expected '") + c + "'");
        pos_++;
    }

    static bool is_ident_char(char c) {
        auto u = static_cast<unsigned char>(c);
        return std::isalnum(u) || c == '-' || c == '_' || u >= 0x80;
    }

    std::string ident() {
        size_t start = pos_;
        while (!eof() && is_ident_char(s_[pos_]))
            pos_++;
        if (start == pos_)
            fail("expected identifier");
        return s_.substr(start, pos_ - start);
    }

    std::string value() {
        char quote = peek();
        if (quote != '"' && quote != '\'')
            return ident();

        pos_++;
        size_t end = s_.find(quote, pos_);
        if (end == std::string::npos)
            fail("unterminated string");
        std::string out = s_.substr(pos_, end - pos_);
        pos_            = end + 1;
        return out;
    }

    Selector::AttributeTest attribute() {
        using Op = Selector::AttributeTest::Op;

        Selector::AttributeTest test;
        expect('[');
        skip_ws();
        test.name = Utils::Text::to_lower(ident());
        skip_ws();
        if (peek() == ']') {
            pos_++;
            return test;
        }

        char c = peek();
        if (c == '=') {
            test.op = Op::Equals;
            pos_++;
        }
        else {
            switch (c) {
                case '~': test.op = Op::Includes; break;
                case '^': test.op = Op::Prefix; break;
                case '$': test.op = Op::Suffix; break;
                case '*': test.op = Op::Contains; break;
                default: fail("unsupported attribute operator");
            }
            pos_++;
            expect('=');
        }

        skip_ws();
        test.value = value();
        skip_ws();
        expect(']');
        return test;
    }

    Selector::Compound compound() {
        Selector::Compound out;
        size_t             start = pos_;

        if (peek() == '*') {
            pos_++;
        }
        else if (is_ident_char(peek())) {
            out.tag = Utils::Text::to_lower(ident());
        }

        while (!eof()) {
            char c = peek();
            if (c == '#') {
                pos_++;
                out.id = ident();
            }
            else if (c == '.') {
                pos_++;
                out.classes.push_back(ident());
            }
            else if (c == '[') {
                out.attributes.push_back(attribute());
            }
            else if (c == ':') {
                fail("pseudo-classes are not supported");
            }
            else {
                break;
            }
        }

        if (pos_ == start)
            fail("expected selector");
        return out;
    }

    Selector::Complex parse_complex() {
        Selector::Complex out;
        out.parts.push_back(compound());

        while (true) {
            bool had_space = skip_ws();
            if (eof() || peek() == ',')
                break;

            char combinator = ' ';
            if (peek() == '>') {
                combinator = '>';
                pos_++;
                skip_ws();
            }
            else if (peek() == '+' || peek() == '~') {
                fail("sibling combinators are not supported");
            }
            else if (!had_space) {
                fail("unexpected character");
            }

            out.parts.push_back(compound());
            out.combinators.push_back(combinator);
        }
        return out;
    }
};

bool attribute_matches(const Selector::AttributeTest& test, const Element& element) {
    using Op   = Selector::AttributeTest::Op;
    auto value = element.attr(test.name);
    if (!value)
        return false;

    switch (test.op) {
        case Op::Exists: return true;
        case Op::Equals: return *value == test.value;
        case Op::Includes: {
            if (test.value.empty())
                return false;
            auto tokens = Utils::Text::split(Utils::Text::collapse_whitespace(*value), ' ');
            return std::find(tokens.begin(), tokens.end(), test.value) != tokens.end();
        }
        case Op::Prefix: return !test.value.empty() && Utils::Text::starts_with(*value, test.value);
        case Op::Suffix: return !test.value.empty() && Utils::Text::ends_with(*value, test.value);
        case Op::Contains:
            return !test.value.empty() && value->find(test.value) != std::string::npos;
    }
    return false;
}

}  // namespace

Selector Selector::parse(const std::string& css) {
    Selector selector;
    selector.source_ = css;
    selector.groups_ = SelectorParser(css).parse();
    return selector;
}

bool Selector::matches_compound(const Compound& compound, const Element& element) {
    if (!compound.tag.empty() && element.tag_name() != compound.tag)
        return false;
    if (!compound.id.empty() && element.id() != compound.id)
        return false;

    if (!compound.classes.empty()) {
        auto classes = element.classes();
        for (const auto& cls : compound.classes) {
            if (std::find(classes.begin(), classes.end(), cls) == classes.end())
                return false;
        }
    }

    return std::all_of(compound.attributes.begin(),
                       compound.attributes.end(),
                       [&](const AttributeTest& test) { return attribute_matches(test, element); });
}

bool Selector::matches_from(const Complex& complex, size_t index, const Element& element) {
    if (!matches_compound(complex.parts[index], element))
        return false;
    if (index == 0)
        return true;

    char combinator = complex.combinators[index - 1];
    auto ancestor   = element.parent();
    if (combinator == '>')
        return ancestor && matches_from(complex, index - 1, *ancestor);

    while (ancestor) {
        if (matches_from(complex, index - 1, *ancestor))
            return true;
        ancestor = ancestor->parent();
    }
    return false;
}

bool Selector::matches(const Element& element) const {
    return std::any_of(groups_.begin(), groups_.end(), [&](const Complex& complex) {
        return matches_from(complex, complex.parts.size() - 1, element);
    });
}

}  // namespace Parsing
}  // namespace Vortex
