/* spine_weight_index_test.cpp - tests for spine_weight_index.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "spine_weight_index.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <future>
#include <gtest/gtest.h>
#include <memory>
#include <thread>
#include <vector>

namespace {
document_factory counting_factory(const std::string& body, std::shared_ptr<std::atomic<int>> calls) {
	auto inner = make_factory(body);
	return [inner, calls]() {
		++*calls;
		return inner();
	};
}

class fixed_provider : public section_provider {
public:
	void add(std::unique_ptr<section> sec) {
		sections.push_back(std::move(sec));
	}

	[[nodiscard]] size_t get_section_count() const override {
		return sections.size();
	}

	[[nodiscard]] const section* get_section(size_t index) const override {
		return index < sections.size() ? sections[index].get() : nullptr;
	}

private:
	std::vector<std::unique_ptr<section>> sections;
};
} // namespace

TEST(SpineWeightIndexTest, SkipsNonLinearSections) {
	section_list sections;
	sections.add_section(make_factory("<p>aaaa</p>"));
	sections.add_section(make_factory("<p>nnnnnnnnnn</p>"), false);
	sections.add_section(make_factory("<p>bbbbbb</p>"));
	sections.add_section(make_factory(""));
	const spine_weight_index index(sections);
	ASSERT_EQ(index.get_entries().size(), 3u);
	EXPECT_EQ(index.get_total_characters(), 10u);
	EXPECT_EQ(index.find(1), nullptr);
	const spine_entry* third = index.find(2);
	ASSERT_NE(third, nullptr);
	EXPECT_EQ(third->character_count, 6u);
	EXPECT_EQ(third->characters_before, 4u);
	const spine_entry* last = index.find(3);
	ASSERT_NE(last, nullptr);
	EXPECT_EQ(last->character_count, 0u);
	EXPECT_EQ(last->characters_before, 10u);
	EXPECT_EQ(index.find(42), nullptr);
}

TEST(SpineWeightIndexTest, SectionFractions) {
	section_list sections;
	sections.add_section(make_factory("<p>aaaa</p>"));
	sections.add_section(make_factory("<p>bbbbbb</p>"));
	const spine_weight_index index(sections);
	const std::vector<double> fractions = index.get_section_fractions();
	ASSERT_EQ(fractions.size(), 3u);
	EXPECT_DOUBLE_EQ(fractions[0], 0.0);
	EXPECT_DOUBLE_EQ(fractions[1], 0.4);
	EXPECT_DOUBLE_EQ(fractions[2], 1.0);
}

TEST(SpineWeightIndexTest, EmptyBookHasNoFractions) {
	section_list sections;
	sections.add_section(make_factory(""));
	sections.add_section({});
	const spine_weight_index index(sections);
	EXPECT_EQ(index.get_total_characters(), 0u);
	EXPECT_TRUE(index.get_section_fractions().empty());
	ASSERT_NE(index.find(1), nullptr);
	EXPECT_EQ(index.find(1)->character_count, 0u);
}

TEST(SpineWeightIndexTest, CharacterCountIsComputedOnce) {
	auto calls = std::make_shared<std::atomic<int>>(0);
	section sec(0, counting_factory("<p>abcdef</p>", calls));
	std::vector<std::thread> threads;
	for (int i = 0; i < 8; ++i) {
		threads.emplace_back([&sec]() {
			EXPECT_EQ(sec.get_character_count(), 6u);
		});
	}
	for (auto& thread : threads) {
		thread.join();
	}
	EXPECT_EQ(sec.get_character_count(), 6u);
	EXPECT_EQ(calls->load(), 1);
}

TEST(SpineWeightIndexTest, PrecomputedCountSkipsParsing) {
	auto calls = std::make_shared<std::atomic<int>>(0);
	fixed_provider provider;
	provider.add(std::make_unique<section>(0, counting_factory("<p>abc</p>", calls), true, 120));
	provider.add(std::make_unique<section>(1, counting_factory("<p>abc</p>", calls), true, 80));
	const spine_weight_index index(provider);
	EXPECT_EQ(index.get_total_characters(), 200u);
	EXPECT_EQ(calls->load(), 0);
}

TEST(SpineWeightIndexTest, UnreadableSectionWeighsNothing) {
	section_list sections;
	sections.add_section(make_factory("<p>abcd</p>"));
	sections.add_section([]() -> std::future<document_ptr> {
		return std::async(std::launch::deferred, []() -> document_ptr {
			throw std::runtime_error("corrupt entry");
		});
	});
	const spine_weight_index index(sections);
	EXPECT_EQ(index.get_total_characters(), 4u);
	ASSERT_NE(index.find(1), nullptr);
	EXPECT_EQ(index.find(1)->character_count, 0u);
}
