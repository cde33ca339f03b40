#include <gtest/gtest.h>
#include "source/ImageSource.hpp"
#include "TestSupport.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace pfs::source;
using namespace pfs::fs::model;
using namespace pfs::config;
using namespace pfs::test;

class ImageSourceTest : public ::testing::Test {
protected:
    // /A/B/C with a photo in C and one in A
    static void loadNested(Tag& root) {
        auto& c = TestSource::makeTags(root, "/A/B/C");
        c.add(photo("1", "Deep"));
        TestSource::makeTags(root, "/A").add(photo("2", "Shallow"));
    }
};

TEST_F(ImageSourceTest, EmptySourceHasRoot) {
    TestSource source;
    const auto node = source.locate("/");
    ASSERT_TRUE(node);
    EXPECT_TRUE(node->isRoot());
    EXPECT_TRUE(node->tag->empty());
    EXPECT_EQ(source.generation(), 0u);
}

TEST_F(ImageSourceTest, MakeTagsBuildsParentChain) {
    TestSource source(loadNested);
    source.refresh();

    const auto c = source.locate("/A/B/C");
    ASSERT_TRUE(c && c->isDirectory());
    EXPECT_EQ(c->tag->name(), "C");
    ASSERT_NE(c->tag->parent(), nullptr);
    EXPECT_EQ(c->tag->parent()->name(), "B");
    EXPECT_EQ(c->tag->parent()->parent()->name(), "A");
    EXPECT_EQ(c->tag->parent()->parent()->parent(), c->tree.get());
    EXPECT_EQ(c->tag->path(), "/A/B/C");
}

TEST_F(ImageSourceTest, MakeTagsReusesExistingTags) {
    Tag root;
    auto& first = TestSource::makeTags(root, "/A/B");
    auto& second = TestSource::makeTags(root, "/A/B");
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(root.size(), 1u);
}

TEST_F(ImageSourceTest, LocateImagesAndMisses) {
    TestSource source(loadNested);
    source.refresh();

    const auto img = source.locate("/A/B/C/Deep.jpg");
    ASSERT_TRUE(img);
    EXPECT_TRUE(img->isImage());
    EXPECT_FALSE(img->isDirectory());

    EXPECT_FALSE(source.locate("/A/Missing"));
    EXPECT_FALSE(source.locate("/A/Shallow.jpg/below"));
    EXPECT_TRUE(source.locate("/A//B/"));
}

TEST_F(ImageSourceTest, LocateRejectsRelativePaths) {
    TestSource source;
    EXPECT_THROW((void)source.locate("A/B"), std::invalid_argument);
}

TEST_F(ImageSourceTest, RefreshOnlyReloadsWhenStampChanges) {
    TestSource source(loadNested);
    source.refresh();
    source.refresh();
    EXPECT_EQ(source.loads.load(), 1);
    EXPECT_EQ(source.generation(), 1u);

    source.stamp = 42;
    source.refresh();
    EXPECT_EQ(source.loads.load(), 2);
    EXPECT_EQ(source.generation(), 2u);
}

TEST_F(ImageSourceTest, NodeOutlivesReload) {
    TestSource source(loadNested);
    source.refresh();

    const auto before = source.locate("/A/B/C/Deep.jpg");
    ASSERT_TRUE(before);

    source.stamp = 1;
    source.refresh();

    EXPECT_NE(before->tree, source.root());
    EXPECT_EQ(before->image->title(), "Deep");
}

TEST_F(ImageSourceTest, FailedRefreshKeepsPublishedTree) {
    TestSource source(loadNested);
    source.refresh();
    const auto tree = source.root();

    source.failing = true;
    source.stamp = 7;
    EXPECT_THROW(source.refresh(), SourceError);
    EXPECT_EQ(source.root(), tree);
    EXPECT_TRUE(source.locate("/A/B/C"));
}

TEST_F(ImageSourceTest, LoaderFailureKeepsPublishedTree) {
    bool fail = false;
    TestSource source([&](Tag& root) {
        if (fail) throw SourceError("corrupt");
        loadNested(root);
    });
    source.refresh();
    const auto tree = source.root();

    fail = true;
    source.stamp = 3;
    EXPECT_THROW(source.refresh(), SourceError);
    EXPECT_EQ(source.root(), tree);
    EXPECT_EQ(source.generation(), 1u);
}

TEST_F(ImageSourceTest, ConcurrentReadersDuringReload) {
    TestSource source(loadNested);
    source.refresh();

    std::atomic<bool> done{false};
    std::atomic<int> misses{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i)
        readers.emplace_back([&] {
            while (!done) if (!source.locate("/A/B/C/Deep.jpg")) ++misses;
        });

    for (int i = 1; i <= 50; ++i) {
        source.stamp = i;
        source.refresh();
    }
    done = true;
    for (auto& t : readers) t.join();

    EXPECT_EQ(misses.load(), 0);
    EXPECT_EQ(source.generation(), 51u);
}

TEST_F(ImageSourceTest, RegistryRejectsUnknownNames) {
    EXPECT_THROW(ImageSource::get("no-such-source"), ConfigError);
}

TEST_F(ImageSourceTest, RegistryListsRegisteredSources) {
    ImageSource::registerSource("test", [](const SourceConfig&) { return std::make_unique<TestSource>(); });
    registerBuiltinSources();

    const auto names = ImageSource::names();
    EXPECT_NE(std::ranges::find(names, "test"), names.end());
    EXPECT_NE(std::ranges::find(names, "shotwell"), names.end());
    EXPECT_TRUE(std::ranges::is_sorted(names));

    const auto source = ImageSource::get("test")(SourceConfig{});
    ASSERT_NE(source, nullptr);
    EXPECT_EQ(source->dateFormat(), DEFAULT_DATE_FORMAT);
}
