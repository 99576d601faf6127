#include <gtest/gtest.h>

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

#include "errors.hpp"
#include "hash_trie_set.hpp"

using Set = rpds::HashTrieSet<int>;

template<typename S>
std::vector<typename S::value_type> sorted(const S& s) {
	std::vector<typename S::value_type> result(s.begin(), s.end());
	std::sort(result.begin(), result.end());
	return result;
}

TEST(HashTrieSet, empty) {
	Set s;
	EXPECT_TRUE(s.empty());
	EXPECT_EQ(s.size(), 0u);
	EXPECT_FALSE(s.contains(1));
	EXPECT_EQ(s.begin(), s.end());
}

TEST(HashTrieSet, insertIsPersistent) {
	Set s1;
	Set s2 = s1.insert(1);
	Set s3 = s2.insert(2).insert(1);
	EXPECT_TRUE(s1.empty());
	EXPECT_EQ(s2.size(), 1u);
	EXPECT_EQ(s3.size(), 2u);
	EXPECT_EQ(sorted(s3), (std::vector<int>{1, 2}));
}

TEST(HashTrieSet, removeAndDiscard) {
	Set s = {1, 2, 3};
	EXPECT_EQ(s.remove(2), (Set{1, 3}));
	EXPECT_THROW(s.remove(4), rpds::KeyNotFound<int>);
	EXPECT_EQ(s.discard(4), s);
	EXPECT_EQ(s.size(), 3u);
}

TEST(HashTrieSet, duplicatesCollapse) {
	std::vector<int> values{5, 5, 6, 5, 6};
	Set s(values.begin(), values.end());
	EXPECT_EQ(s.size(), 2u);
	EXPECT_EQ(s, (Set{6, 5}));
}

TEST(HashTrieSet, setOperations) {
	Set a = {1, 2, 3, 4};
	Set b = {3, 4, 5};

	EXPECT_EQ(sorted(a.union_(b)), (std::vector<int>{1, 2, 3, 4, 5}));
	EXPECT_EQ(sorted(a.intersection(b)), (std::vector<int>{3, 4}));
	EXPECT_EQ(sorted(a.difference(b)), (std::vector<int>{1, 2}));
	EXPECT_EQ(sorted(b.difference(a)), (std::vector<int>{5}));
	EXPECT_EQ(sorted(a.symmetricDifference(b)), (std::vector<int>{1, 2, 5}));

	EXPECT_EQ(a.union_(Set()), a);
	EXPECT_TRUE(a.intersection(Set()).empty());
}

TEST(HashTrieSet, predicates) {
	Set a = {1, 2};
	Set b = {1, 2, 3};
	Set c = {7};

	EXPECT_TRUE(a.isSubset(b));
	EXPECT_FALSE(b.isSubset(a));
	EXPECT_TRUE(b.isSuperset(a));
	EXPECT_TRUE(a.isSubset(a));
	EXPECT_TRUE(Set().isSubset(a));
	EXPECT_TRUE(a.isDisjoint(c));
	EXPECT_FALSE(a.isDisjoint(b));
}

TEST(HashTrieSet, print) {
	std::ostringstream empty;
	empty << Set();
	EXPECT_EQ(empty.str(), "HashTrieSet({})");

	std::ostringstream single;
	single << rpds::HashTrieSet<std::string>{"foo"};
	EXPECT_EQ(single.str(), "HashTrieSet({foo})");
}
