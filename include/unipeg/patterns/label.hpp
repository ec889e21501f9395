/**
 * label.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * A pattern that attaches a name to the result. Always succeeds once.
 * Example:  item('x') >> label("x")
 */

#ifndef UNIPEG_PATTERNS_LABEL_HPP
#define UNIPEG_PATTERNS_LABEL_HPP

#include <string>
#include <utility>
#include "../unifiable.hpp"

namespace unipeg {

class label_t : public unifiable {
private:
    std::string m_Label;

public:
    explicit label_t(std::string name)
        : m_Label(std::move(name)) {
    }

    [[nodiscard]] stream<instance> unify(instance const& v) const override {
        return single(instance::labeled(v, m_Label));
    }
};

[[nodiscard]] inline pattern label(std::string name) {
    return make_pattern<label_t>(std::move(name));
}

} /* namespace unipeg */

#endif /* UNIPEG_PATTERNS_LABEL_HPP */
