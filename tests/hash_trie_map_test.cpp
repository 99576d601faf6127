#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "hash_trie_map.hpp"

using Map = rpds::HashTrieMap<std::string, int>;
using IntMap = rpds::HashTrieMap<int, int>;

// Every key lands in the same collision bucket
struct ConstantHash {
	size_t operator()(const std::string&) const { return 42; }
};
using CollidingMap = rpds::HashTrieMap<std::string, int, ConstantHash>;

// Keys share their low chunks and diverge only deep in the trie
struct ShiftedHash {
	size_t operator()(int key) const { return static_cast<size_t>(key) << 40; }
};
using DeepMap = rpds::HashTrieMap<int, int, ShiftedHash>;

template<typename M>
std::map<typename M::key_type, typename M::mapped_type> tomap(const M& m) {
	std::map<typename M::key_type, typename M::mapped_type> result;
	for(const auto& entry : m) result.emplace(entry.key, entry.value);
	return result;
}

TEST(HashTrieMap, empty) {
	Map m;
	EXPECT_TRUE(m.empty());
	EXPECT_EQ(m.size(), 0u);
	EXPECT_FALSE(m.contains("foo"));
	EXPECT_EQ(m.find("foo"), nullptr);
	EXPECT_EQ(m.begin(), m.end());
	EXPECT_EQ(m, Map());
}

TEST(HashTrieMap, insertIsPersistent) {
	Map m1;
	Map m2 = m1.insert("foo", 1);
	Map m3 = m2.insert("foo", 2);

	EXPECT_EQ(m1.size(), 0u);
	EXPECT_EQ(m2.size(), 1u);
	EXPECT_EQ(m3.size(), 1u);
	EXPECT_EQ(m2.at("foo"), 1);
	EXPECT_EQ(m3.at("foo"), 2);
	EXPECT_FALSE(m1.contains("foo"));
}

TEST(HashTrieMap, insertEqualValueSharesTrie) {
	Map m = Map().insert("foo", 1).insert("bar", 2);
	Map same = m.insert("foo", 1);
	EXPECT_TRUE(same.sharesRootWith(m));
	EXPECT_EQ(same.size(), 2u);
}

TEST(HashTrieMap, removeAndDiscard) {
	Map m = {{"foo", 1}, {"bar", 2}};

	Map removed = m.remove("foo");
	EXPECT_EQ(removed.size(), 1u);
	EXPECT_FALSE(removed.contains("foo"));
	EXPECT_TRUE(m.contains("foo"));

	EXPECT_THROW(removed.remove("foo"), rpds::KeyNotFound<std::string>);
	Map discarded = m.discard("missing");
	EXPECT_TRUE(discarded.sharesRootWith(m));
	EXPECT_EQ(discarded, m);
}

TEST(HashTrieMap, removeLastEntry) {
	Map m = Map().insert("only", 1).remove("only");
	EXPECT_TRUE(m.empty());
	EXPECT_EQ(m, Map());
	EXPECT_EQ(m.begin(), m.end());
}

TEST(HashTrieMap, keyNotFoundCarriesKey) {
	Map m = {{"foo", 1}};
	try {
		m.at("bar");
		FAIL() << "expected KeyNotFound";
	} catch(const rpds::KeyNotFound<std::string>& e) {
		EXPECT_EQ(e.key(), "bar");
	}
	EXPECT_THROW(m["bar"], std::out_of_range);
}

TEST(HashTrieMap, get) {
	Map m = {{"foo", 1}};
	EXPECT_EQ(m.get("foo", 7), 1);
	EXPECT_EQ(m.get("bar", 7), 7);
}

TEST(HashTrieMap, equalityIgnoresInsertionOrder) {
	IntMap forward, backward;
	for(int i = 0; i < 50; ++i) forward = forward.insert(i, i * 10);
	for(int i = 49; i >= 0; --i) backward = backward.insert(i, i * 10);

	EXPECT_EQ(forward, backward);
	EXPECT_NE(forward, backward.insert(3, 0));
	EXPECT_NE(forward, backward.remove(3));
}

TEST(HashTrieMap, insertThenRemoveRestoresMap) {
	IntMap base;
	for(int i = 0; i < 200; ++i) base = base.insert(i, i);
	IntMap grown = base.insert(1000, 1);
	EXPECT_EQ(grown.remove(1000), base);
	EXPECT_EQ(tomap(grown.remove(1000)), tomap(base));
}

TEST(HashTrieMap, collisions) {
	CollidingMap m;
	m = m.insert("a", 1).insert("b", 2).insert("c", 3);
	EXPECT_EQ(m.size(), 3u);
	EXPECT_EQ(m.at("a"), 1);
	EXPECT_EQ(m.at("b"), 2);
	EXPECT_EQ(m.at("c"), 3);
	EXPECT_FALSE(m.contains("d"));

	CollidingMap updated = m.insert("b", 20);
	EXPECT_EQ(updated.size(), 3u);
	EXPECT_EQ(updated.at("b"), 20);
	EXPECT_EQ(m.at("b"), 2);

	CollidingMap removed = m.remove("a").remove("c");
	EXPECT_EQ(removed.size(), 1u);
	EXPECT_EQ(removed.at("b"), 2);
	EXPECT_TRUE(removed.remove("b").empty());
	EXPECT_THROW(removed.remove("a"), rpds::KeyNotFound<std::string>);

	EXPECT_EQ(m, CollidingMap().insert("c", 3).insert("b", 2).insert("a", 1));
}

TEST(HashTrieMap, deepDivergence) {
	DeepMap m;
	for(int i = 0; i < 40; ++i) m = m.insert(i, -i);
	EXPECT_EQ(m.size(), 40u);
	for(int i = 0; i < 40; ++i) EXPECT_EQ(m.at(i), -i);
	for(int i = 0; i < 40; i += 2) m = m.remove(i);
	EXPECT_EQ(m.size(), 20u);
	for(int i = 1; i < 40; i += 2) EXPECT_EQ(m.at(i), -i);
	for(int i = 0; i < 40; i += 2) EXPECT_FALSE(m.contains(i));
}

TEST(HashTrieMap, largeMap) {
	std::vector<std::pair<std::string, int>> items;
	for(int i = 0; i < 1700; ++i) items.emplace_back(std::to_string(i), i);
	Map m(items.begin(), items.end());

	EXPECT_EQ(m.size(), 1700u);
	EXPECT_EQ(m.at("16"), 16);
	EXPECT_EQ(m.at("1699"), 1699);

	Map removed = m.remove("1600");
	EXPECT_EQ(removed.size(), 1699u);
	EXPECT_FALSE(removed.contains("1600"));
	EXPECT_TRUE(m.contains("1600"));
}

TEST(HashTrieMap, bulkBuildMatchesRepeatedInsert) {
	std::vector<std::pair<int, int>> items;
	for(int i = 0; i < 3000; ++i) items.emplace_back(i % 2500, i);
	IntMap bulk = IntMap::fromRange(items.begin(), items.end());

	IntMap incremental;
	for(const auto& item : items) incremental = incremental.insert(item.first, item.second);

	EXPECT_EQ(bulk.size(), 2500u);
	EXPECT_EQ(bulk, incremental);
	// Later duplicates win
	EXPECT_EQ(bulk.at(10), 2510);
	EXPECT_EQ(bulk.at(2499), 2499);
}

TEST(HashTrieMap, bulkBuildCollisions) {
	std::vector<std::pair<std::string, int>> items;
	for(int i = 0; i < 1200; ++i) items.emplace_back(std::to_string(i % 5), i);
	CollidingMap m = CollidingMap::fromRange(items.begin(), items.end());
	EXPECT_EQ(m.size(), 5u);
	EXPECT_EQ(m.at("0"), 1195);
	EXPECT_EQ(m.at("4"), 1199);
}

TEST(HashTrieMap, iterationVisitsEveryEntryOnce) {
	IntMap m;
	for(int i = 0; i < 500; ++i) m = m.insert(i, i * i);
	std::vector<int> keys;
	for(const auto& entry : m) {
		EXPECT_EQ(entry.value, entry.key * entry.key);
		keys.push_back(entry.key);
	}
	std::sort(keys.begin(), keys.end());
	ASSERT_EQ(keys.size(), 500u);
	for(int i = 0; i < 500; ++i) EXPECT_EQ(keys[i], i);
}

TEST(HashTrieMap, iteratorNext) {
	IntMap m = {{1, 2}};
	auto it = m.begin();
	ASSERT_TRUE(it.hasNext());
	EXPECT_EQ(it.next().key, 1);
	EXPECT_FALSE(it.hasNext());
	EXPECT_THROW(it.next(), std::out_of_range);
}

TEST(HashTrieMap, views) {
	Map m = {{"foo", 1}, {"bar", 2}};

	auto keys = m.keys();
	EXPECT_EQ(keys.size(), 2u);
	EXPECT_TRUE(keys.contains("foo"));
	EXPECT_FALSE(keys.contains("baz"));
	std::vector<std::string> keyList(keys.begin(), keys.end());
	std::sort(keyList.begin(), keyList.end());
	EXPECT_EQ(keyList, (std::vector<std::string>{"bar", "foo"}));

	auto values = m.values();
	EXPECT_TRUE(values.contains(2));
	EXPECT_FALSE(values.contains(3));
	std::vector<int> valueList(values.begin(), values.end());
	std::sort(valueList.begin(), valueList.end());
	EXPECT_EQ(valueList, (std::vector<int>{1, 2}));

	auto items = m.items();
	EXPECT_TRUE(items.contains("foo", 1));
	EXPECT_FALSE(items.contains("foo", 2));
	EXPECT_FALSE(items.contains("baz", 1));
	size_t seen = 0;
	for(auto it = items.begin(); it != items.end(); ++it) {
		auto item = *it;
		EXPECT_EQ(m.at(item.first), item.second);
		++seen;
	}
	EXPECT_EQ(seen, 2u);
}

TEST(HashTrieMap, viewsOutliveMap) {
	auto keys = Map{{"foo", 1}}.keys();
	EXPECT_TRUE(keys.contains("foo"));
	EXPECT_EQ(*keys.begin(), "foo");
}

TEST(HashTrieMap, update) {
	Map m = {{"a", 1}, {"b", 2}};
	Map other = {{"b", 20}, {"c", 30}};
	std::vector<std::pair<std::string, int>> pairs{{"c", 300}, {"d", 400}};

	Map merged = m.update(other, pairs);
	EXPECT_EQ(merged, (Map{{"a", 1}, {"b", 20}, {"c", 300}, {"d", 400}}));
	EXPECT_EQ(m.size(), 2u);

	EXPECT_EQ(Map().update(other), other);
	EXPECT_TRUE(m.update().sharesRootWith(m));
}

TEST(HashTrieMap, updateFromMaps) {
	Map m = {{"a", 1}};
	Map first = {{"a", 10}, {"b", 2}};
	Map second = {{"b", 20}, {"c", 3}};

	Map merged = m.update(first, second);
	EXPECT_EQ(merged, (Map{{"a", 10}, {"b", 20}, {"c", 3}}));
	EXPECT_EQ(merged.size(), 3u);
	EXPECT_EQ(first, (Map{{"a", 10}, {"b", 2}}));

	// Equal values from the source leave the receiver's trie untouched
	EXPECT_TRUE(first.update(Map{{"a", 10}}).sharesRootWith(first));
}

TEST(HashTrieMap, updateFromCollidingMap) {
	CollidingMap m = CollidingMap().insert("a", 1).insert("b", 2);
	CollidingMap other = CollidingMap().insert("b", 20).insert("c", 3);
	CollidingMap merged = m.update(other);
	EXPECT_EQ(merged.size(), 3u);
	EXPECT_EQ(merged.at("a"), 1);
	EXPECT_EQ(merged.at("b"), 20);
	EXPECT_EQ(merged.at("c"), 3);
}

TEST(HashTrieMap, iteratorSharesEntries) {
	IntMap m = {{1, 2}, {3, 4}};
	for(auto it = m.begin(); it != m.end(); ++it) {
		EXPECT_EQ(it.entryPtr().get(), &*it);
		EXPECT_EQ(it.entryPtr()->value, m.at(it->key));
	}
}

TEST(HashTrieMap, print) {
	std::ostringstream empty;
	empty << Map();
	EXPECT_EQ(empty.str(), "HashTrieMap({})");

	std::ostringstream single;
	single << Map{{"foo", 1}};
	EXPECT_EQ(single.str(), "HashTrieMap({foo: 1})");
}
