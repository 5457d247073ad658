/* navigation_resolver.hpp - location reference resolution interface.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "anchor.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>

struct navigation_result {
	std::optional<size_t> index;
	std::optional<anchor> target;

	[[nodiscard]] bool resolved() const noexcept {
		return index.has_value() && target.has_value();
	}
};

// Turns an opaque location reference into a section index and an anchor. Implementations may throw on malformed
// references; callers are expected to contain the failure.
class navigation_resolver {
public:
	virtual ~navigation_resolver() = default;
	[[nodiscard]] virtual navigation_result resolve(const std::string& location) const = 0;
};

class callback_resolver : public navigation_resolver {
public:
	using callback = std::function<navigation_result(const std::string&)>;

	explicit callback_resolver(callback fn) : resolve_fn{std::move(fn)} {
	}

	[[nodiscard]] navigation_result resolve(const std::string& location) const override {
		return resolve_fn(location);
	}

private:
	callback resolve_fn;
};
