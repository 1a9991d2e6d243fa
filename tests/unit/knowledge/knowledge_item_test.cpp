#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <memex/knowledge/knowledge_item.h>

using namespace memex;
using namespace memex::knowledge;

TEST(KnowledgeItemTest, ParsesEntityTypeNames) {
    EXPECT_EQ(parseEntityType("fact"), EntityType::Fact);
    EXPECT_EQ(parseEntityType("goal"), EntityType::Goal);
    EXPECT_EQ(parseEntityType("list_item"), EntityType::ListItem);
    EXPECT_EQ(parseEntityType("shopping_item"), EntityType::ListItem);
    EXPECT_FALSE(parseEntityType("note").has_value());
    EXPECT_EQ(sourceTypeFor(EntityType::ListItem), "knowledge_list_item");
}

TEST(KnowledgeItemTest, DefaultsPerType) {
    auto goal = KnowledgeMetadata::defaultFor(EntityType::Goal);
    EXPECT_EQ(goal.type(), EntityType::Goal);
    EXPECT_EQ(goal.status(), std::optional<std::string>("active"));

    auto list = KnowledgeMetadata::defaultFor(EntityType::ListItem);
    auto* l = std::get_if<ListItemMetadata>(&list.typed);
    ASSERT_NE(l, nullptr);
    EXPECT_EQ(l->list, "shopping");
    EXPECT_FALSE(l->done);

    auto item = KnowledgeItem::make(EntityType::Fact, "x", 0.7);
    EXPECT_EQ(item.metadata.type(), EntityType::Fact);
    EXPECT_DOUBLE_EQ(item.confidence, 0.7);
}

TEST(KnowledgeItemTest, JsonKeepsTypedAndExtraFieldsFlat) {
    KnowledgeMetadata m = KnowledgeMetadata::defaultFor(EntityType::Goal);
    std::get<GoalMetadata>(m.typed).description = "ship v1";
    m.extra["source"] = "chat";

    auto j = nlohmann::json::parse(m.toJson());
    EXPECT_EQ(j["description"], "ship v1");
    EXPECT_EQ(j["status"], "active");
    EXPECT_EQ(j["source"], "chat");

    auto back = KnowledgeMetadata::fromJson(EntityType::Goal, m.toJson());
    ASSERT_TRUE(back);
    EXPECT_EQ(back.value().description(), std::optional<std::string>("ship v1"));
    EXPECT_EQ(back.value().extra.at("source"), "chat");
    EXPECT_EQ(back.value().extra.count("status"), 0u);
}

TEST(KnowledgeItemTest, FromJsonStringifiesNonStringExtras) {
    auto m = KnowledgeMetadata::fromJson(EntityType::Fact,
                                         R"({"category":"preference","weight":3,"tags":null})");
    ASSERT_TRUE(m);
    EXPECT_EQ(m.value().category(), std::optional<std::string>("preference"));
    EXPECT_EQ(m.value().extra.at("weight"), "3");
    EXPECT_EQ(m.value().extra.count("tags"), 0u);
}

TEST(KnowledgeItemTest, FromJsonRejectsMistypedFields) {
    auto badCategory = KnowledgeMetadata::fromJson(EntityType::Fact, R"({"category":5})");
    ASSERT_FALSE(badCategory);
    EXPECT_EQ(badCategory.error().code, ErrorCode::InvalidData);

    auto badDone = KnowledgeMetadata::fromJson(EntityType::ListItem, R"({"done":"yes"})");
    ASSERT_FALSE(badDone);

    auto notObject = KnowledgeMetadata::fromJson(EntityType::Fact, "[1,2]");
    ASSERT_FALSE(notObject);

    auto garbage = KnowledgeMetadata::fromJson(EntityType::Fact, "{not json");
    ASSERT_FALSE(garbage);
}

TEST(KnowledgeItemTest, EmptyJsonGivesDefaults) {
    auto m = KnowledgeMetadata::fromJson(EntityType::ListItem, "");
    ASSERT_TRUE(m);
    auto* l = std::get_if<ListItemMetadata>(&m.value().typed);
    ASSERT_NE(l, nullptr);
    EXPECT_EQ(l->list, "shopping");

    auto blankStatus = KnowledgeMetadata::fromJson(EntityType::Goal, R"({"status":""})");
    ASSERT_TRUE(blankStatus);
    EXPECT_EQ(blankStatus.value().status(), std::optional<std::string>("active"));
}
