#include <gtest/gtest.h>
#include <memex/context/memory_injector.h>
#include <memex/knowledge/knowledge_store.h>

#include "../../support/memex_test_stack.hpp"
#include "../../support/temp_dir_scope.hpp"

using namespace memex;
using namespace memex::context;
using namespace memex::knowledge;
using memex::test_support::TempDirScope;
using memex::test_support::TestStack;

class MemoryInjectorTest : public ::testing::Test {
protected:
    void SetUp() override { rebuild(false); }

    void rebuild(bool withVectorIndex, InjectorConfig config = {}) {
        injector_.reset();
        store_.reset();
        stack_ = std::make_unique<TestStack>(withVectorIndex);
        store_ = std::make_unique<KnowledgeStore>(stack_->db, stack_->embeddings.get(),
                                                  KnowledgeStoreConfig{}, &stack_->background);
        injector_ = std::make_unique<MemoryInjector>(*store_, nullptr, config);
    }

    void TearDown() override {
        if (store_) {
            store_->waitForPendingEmbeddings();
        }
    }

    bool hasFts5() {
        auto r = stack_->db.hasFTS5();
        return r && r.value();
    }

    RowId add(EntityType type, const std::string& content,
              std::optional<KnowledgeMetadata> meta = std::nullopt, double confidence = 1.0) {
        auto id = store_->addItem(1, type, content, std::move(meta), confidence);
        EXPECT_TRUE(id) << content;
        return id ? id.value() : 0;
    }

    std::unique_ptr<TestStack> stack_;
    std::unique_ptr<KnowledgeStore> store_;
    std::unique_ptr<MemoryInjector> injector_;
};

TEST_F(MemoryInjectorTest, EmptyStoreLeavesBaseUntouched) {
    auto prompt = injector_->buildSystemPrompt(1, "what should I cook tonight?", "BASE");
    ASSERT_TRUE(prompt);
    EXPECT_EQ(prompt.value(), "BASE");

    auto block = injector_->buildContext(1, "anything");
    ASSERT_TRUE(block);
    EXPECT_TRUE(block.value().empty());
}

TEST_F(MemoryInjectorTest, KeywordFallbackFindsFactWithoutVectorIndex) {
    if (!hasFts5()) {
        GTEST_SKIP() << "SQLite built without FTS5";
    }
    add(EntityType::Fact, "Uses dark mode UI");

    auto block = injector_->buildContext(1, "dark mode");
    ASSERT_TRUE(block);
    EXPECT_FALSE(block.value().empty());
    EXPECT_NE(block.value().find("Uses dark mode UI"), std::string::npos);
}

TEST_F(MemoryInjectorTest, SystemPromptAppendsBlockAfterBlankLine) {
    add(EntityType::Fact, "Uses dark mode UI");
    auto prompt = injector_->buildSystemPrompt(1, "dark mode", "BASE");
    ASSERT_TRUE(prompt);
    ASSERT_EQ(prompt.value().rfind("BASE\n\n<memory>", 0), 0u) << prompt.value();
    EXPECT_EQ(prompt.value().substr(prompt.value().size() - 9), "</memory>");
}

TEST_F(MemoryInjectorTest, RecentItemsFillInWhenNothingMatches) {
    add(EntityType::Fact, "Has two cats");
    add(EntityType::Goal, "Learn to juggle");

    auto ctx = injector_->collect(1, "zzzz unrelated words");
    ASSERT_TRUE(ctx);
    ASSERT_EQ(ctx.value().facts.size(), 1u);
    EXPECT_EQ(ctx.value().facts[0].content, "Has two cats");
    ASSERT_EQ(ctx.value().goals.size(), 1u);
}

TEST_F(MemoryInjectorTest, SectionLimitsAreApplied) {
    for (int i = 0; i < 8; ++i) {
        add(EntityType::Fact, "fact number " + std::to_string(i));
        add(EntityType::Goal, "goal number " + std::to_string(i) + " distinct " +
                                  std::string(1, static_cast<char>('a' + i)));
        add(EntityType::ListItem, "item number " + std::to_string(i));
    }
    auto ctx = injector_->collect(1, "");
    ASSERT_TRUE(ctx);
    EXPECT_EQ(ctx.value().facts.size(), 5u);
    EXPECT_EQ(ctx.value().goals.size(), 3u);
    EXPECT_EQ(ctx.value().listItems.size(), 5u);
}

TEST_F(MemoryInjectorTest, ConfidenceFloorFiltersFacts) {
    add(EntityType::Fact, "might like sushi", std::nullopt, 0.3);
    add(EntityType::Fact, "definitely likes ramen", std::nullopt, 0.9);

    auto ctx = injector_->collect(1, "");
    ASSERT_TRUE(ctx);
    ASSERT_EQ(ctx.value().facts.size(), 1u);
    EXPECT_EQ(ctx.value().facts[0].content, "definitely likes ramen");

    auto lowered = injector_->collect(1, "", 0.1);
    ASSERT_TRUE(lowered);
    EXPECT_EQ(lowered.value().facts.size(), 2u);
}

TEST_F(MemoryInjectorTest, OnlyActiveGoalsAndOpenListItems) {
    auto done = add(EntityType::Goal, "Finish the thesis");
    ASSERT_TRUE(store_->setGoalStatus(1, done, "completed").value());
    add(EntityType::Goal, "Run a half marathon");

    auto bought = KnowledgeMetadata::defaultFor(EntityType::ListItem);
    std::get<ListItemMetadata>(bought.typed).done = true;
    add(EntityType::ListItem, "eggs", bought);
    add(EntityType::ListItem, "flour");

    auto ctx = injector_->collect(1, "");
    ASSERT_TRUE(ctx);
    ASSERT_EQ(ctx.value().goals.size(), 1u);
    EXPECT_EQ(ctx.value().goals[0].content, "Run a half marathon");
    ASSERT_EQ(ctx.value().listItems.size(), 1u);
    EXPECT_EQ(ctx.value().listItems[0].content, "flour");
}

TEST_F(MemoryInjectorTest, ShownItemsAreMarkedReferenced) {
    auto id = add(EntityType::Fact, "Prefers window seats");
    ASSERT_TRUE(injector_->buildContext(1, ""));
    auto item = store_->get(1, id).value();
    ASSERT_TRUE(item.has_value());
    EXPECT_TRUE(item->lastReferencedAt.has_value());
}

TEST_F(MemoryInjectorTest, OtherOwnersNeverLeak) {
    ASSERT_TRUE(store_->addItem(2, EntityType::Fact, "owner two private fact"));
    auto block = injector_->buildContext(1, "private fact");
    ASSERT_TRUE(block);
    EXPECT_TRUE(block.value().empty());
}

TEST_F(MemoryInjectorTest, InvalidOwnerIsRejected) {
    auto r = injector_->buildContext(0, "hi");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST_F(MemoryInjectorTest, ProjectReadmeIsIncluded) {
    TempDirScope project = TempDirScope::unique_under("memex_project");
    project.write("README.md", "# Memex\n" + std::string(3000, 'r'));

    auto meta = KnowledgeMetadata::defaultFor(EntityType::Fact);
    std::get<FactMetadata>(meta.typed).category = "project";
    add(EntityType::Fact, project.path().string(), meta);

    auto ctx = injector_->collect(1, "");
    ASSERT_TRUE(ctx);
    ASSERT_EQ(ctx.value().projects.size(), 1u);
    EXPECT_EQ(ctx.value().projects[0].path, project.path().string());
    EXPECT_EQ(ctx.value().projects[0].text.size(), 1500u);
    EXPECT_EQ(ctx.value().projects[0].text.rfind("# Memex", 0), 0u);

    auto block = renderMemoryBlock(ctx.value());
    EXPECT_NE(block.find("<fact category='project_context'>[" + project.path().string() + "]"),
              std::string::npos);
}

TEST_F(MemoryInjectorTest, ProjectWithoutReadmeIsSkipped) {
    auto meta = KnowledgeMetadata::defaultFor(EntityType::Fact);
    std::get<FactMetadata>(meta.typed).category = "project";
    add(EntityType::Fact, "/nonexistent/memex/project", meta);

    auto ctx = injector_->collect(1, "");
    ASSERT_TRUE(ctx);
    EXPECT_TRUE(ctx.value().projects.empty());
    EXPECT_EQ(ctx.value().facts.size(), 1u);
}

TEST_F(MemoryInjectorTest, VectorPathServesWhenIndexAvailable) {
    rebuild(true);
    add(EntityType::Fact, "Allergic to shellfish");
    add(EntityType::Fact, "Plays the cello");
    store_->waitForPendingEmbeddings();

    InjectorConfig cfg;
    cfg.factLimit = 1;
    MemoryInjector injector(*store_, nullptr, cfg);
    auto ctx = injector.collect(1, "allergic to shellfish?");
    ASSERT_TRUE(ctx);
    ASSERT_EQ(ctx.value().facts.size(), 1u);
    EXPECT_EQ(ctx.value().facts[0].content, "Allergic to shellfish");
}

TEST(MemoryBlockTest, RendersSectionsInOrderWithEscaping) {
    MemoryContext ctx;
    auto fact = KnowledgeItem::make(EntityType::Fact, "Likes <b>bold</b> & 'quotes'");
    fact.id = 7;
    std::get<FactMetadata>(fact.metadata.typed).category = "preference";
    ctx.facts.push_back(fact);

    auto goal = KnowledgeItem::make(EntityType::Goal, "Ship v1");
    goal.id = 3;
    std::get<GoalMetadata>(goal.metadata.typed).description = "by March";
    ctx.goals.push_back(goal);

    auto item = KnowledgeItem::make(EntityType::ListItem, "milk");
    item.id = 9;
    ctx.listItems.push_back(item);

    ctx.files.push_back({"/notes/a.md", 2, "snippet", 0.1});

    const std::string expected =
        "<memory>\n"
        "  <facts>\n"
        "    <fact id='7' category='preference'>Likes &lt;b&gt;bold&lt;/b&gt; &amp; "
        "&apos;quotes&apos;</fact>\n"
        "  </facts>\n"
        "  <goals>\n"
        "    <goal id='3'>Ship v1 - by March</goal>\n"
        "  </goals>\n"
        "  <list-section>\n"
        "    <item id='9' list='shopping'>milk</item>\n"
        "  </list-section>\n"
        "  <files>\n"
        "    <file path='/notes/a.md' chunk='2'>snippet</file>\n"
        "  </files>\n"
        "</memory>";
    EXPECT_EQ(renderMemoryBlock(ctx), expected);
}

TEST(MemoryBlockTest, DefaultsAndEmptiness) {
    MemoryContext ctx;
    EXPECT_TRUE(ctx.empty());
    EXPECT_EQ(renderMemoryBlock(ctx), "");

    ctx.facts.push_back(KnowledgeItem::make(EntityType::Fact, "plain"));
    EXPECT_EQ(renderMemoryBlock(ctx),
              "<memory>\n  <facts>\n    <fact category='general'>plain</fact>\n  </facts>\n"
              "</memory>");
    EXPECT_EQ(escapeXml("a\"b"), "a&quot;b");
}

TEST(MemoryInjectorFilesTest, FileSnippetsAreAttached) {
    TestStack stack(false);
    KnowledgeStore store(stack.db, stack.embeddings.get(), {}, &stack.background);
    TempDirScope root = TempDirScope::unique_under("memex_inject_files");
    root.write("runbook.md", "Restart the ingestion worker with systemctl when the queue stalls. " +
                                 std::string(700, 'w'));

    indexing::FileIndexerConfig fcfg;
    fcfg.roots = {root.path()};
    indexing::FileIndexer files(stack.db, stack.embeddings.get(), fcfg);
    ASSERT_TRUE(files.runIncremental());

    InjectorConfig cfg;
    cfg.fileSnippetChars = 40;
    MemoryInjector injector(store, &files, cfg);
    auto ctx = injector.collect(1, "ingestion worker");
    ASSERT_TRUE(ctx);
    ASSERT_EQ(ctx.value().files.size(), 1u);
    EXPECT_EQ(ctx.value().files[0].text.size(), 40u);

    auto block = injector.buildContext(1, "ingestion worker");
    ASSERT_TRUE(block);
    EXPECT_NE(block.value().find("<files>"), std::string::npos);
}
