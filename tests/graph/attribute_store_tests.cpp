/**
 * @file attribute_store_tests.cpp
 */
#include <gtest/gtest.h>
#include "gmlio/graph/attribute_store.hpp"

using namespace gmlio;

TEST(AttributeStoreTests, Smoke_PutGetReplace)
{
    AttributeStore<int> store;
    EXPECT_FALSE(store.get(1, "label").has_value());

    store.put(1, "label", "one");
    store.put(1, "color", "red");
    ASSERT_TRUE(store.get(1, "label").has_value());
    EXPECT_EQ(*store.get(1, "label"), "one");

    store.put(1, "label", "uno");
    EXPECT_EQ(*store.get(1, "label"), "uno");
    EXPECT_FALSE(store.get(2, "label").has_value());
    EXPECT_FALSE(store.get(1, "shape").has_value());
}

TEST(AttributeStoreTests, Remove_DropsEmptyElements)
{
    AttributeStore<int> store;
    store.put(1, "label", "one");
    EXPECT_EQ(store.element_count(), 1u);

    EXPECT_TRUE(store.remove(1, "label"));
    EXPECT_FALSE(store.remove(1, "label"));
    EXPECT_FALSE(store.remove(2, "label"));
    EXPECT_EQ(store.element_count(), 0u);
}

TEST(AttributeStoreTests, AttributesOf_OrderedByKey)
{
    AttributeStore<std::string> store;
    store.put("v", "weight", "3");
    store.put("v", "label", "vee");

    auto attrs = store.attributes_of("v");
    ASSERT_EQ(attrs.size(), 2u);
    EXPECT_EQ(attrs.begin()->first, "label");
    EXPECT_TRUE(store.attributes_of("w").empty());
}

TEST(AttributeStoreTests, Lookup_SeesLaterChanges)
{
    AttributeStore<std::string> store;
    AttributeLookup<std::string> lookup = store.lookup();
    EXPECT_FALSE(lookup("v", k_label_attribute_key).has_value());

    store.put("v", k_label_attribute_key, "hub");
    auto label = lookup("v", k_label_attribute_key);
    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(*label, "hub");
}
