#include <gtest/gtest.h>
#include "fs/Resolver.hpp"
#include "TestSupport.hpp"

#include <stdexcept>

using namespace pfs::fs;
using namespace pfs::fs::model;
using namespace pfs::config;
using namespace pfs::test;

class ResolverTest : public ::testing::Test {
protected:
    TestSource source{[](Tag& root) {
        auto& trip = TestSource::makeTags(root, "/Trip");
        trip.add(photo("1", "Shot"));
        trip.add(video("2", "Clip"));
        TestSource::makeTags(root, "/Clips").add(video("3", "Only"));
        TestSource::makeTags(root, "/Trip/Day").add(photo("4", "Morning"));
    }};

    void SetUp() override { source.refresh(); }

    static std::vector<Filter> defaultFilters() {
        return {Filter::fromConfig({"Photos", MediaKind::Photos}), Filter::fromConfig({"Videos", MediaKind::Videos})};
    }
};

TEST_F(ResolverTest, RootListsFilters) {
    const Resolver resolver(source, defaultFilters());
    const auto root = resolver.locate("/");
    ASSERT_TRUE(root);
    EXPECT_TRUE(root->mountRoot);
    EXPECT_EQ(resolver.readdir(*root), (std::vector<std::string>{"Photos", "Videos"}));
}

TEST_F(ResolverTest, UnknownFilterIsMissing) {
    const Resolver resolver(source, defaultFilters());
    EXPECT_FALSE(resolver.locate("/Music"));
    EXPECT_FALSE(resolver.locate("/Trip"));
}

TEST_F(ResolverTest, FilterRootShowsMatchingTags) {
    const Resolver resolver(source, defaultFilters());

    const auto photos = resolver.locate("/Photos");
    ASSERT_TRUE(photos);
    EXPECT_FALSE(photos->mountRoot);
    EXPECT_EQ(resolver.readdir(*photos), (std::vector<std::string>{"Trip"}));

    const auto videos = resolver.locate("/Videos");
    ASSERT_TRUE(videos);
    EXPECT_EQ(resolver.readdir(*videos), (std::vector<std::string>{"Clips", "Trip"}));
}

TEST_F(ResolverTest, TrailingSlashNamesTheView) {
    TestSource videosOnly{[](Tag& root) { TestSource::makeTags(root, "/Clips").add(video("3", "Only")); }};
    videosOnly.refresh();
    const Resolver resolver(videosOnly, defaultFilters());

    // An empty view still resolves, with or without the slash
    for (const auto* path : {"/Photos", "/Photos/", "/Photos//"}) {
        const auto photos = resolver.locate(path);
        ASSERT_TRUE(photos) << path;
        EXPECT_FALSE(photos->mountRoot);
        EXPECT_EQ(resolver.readdir(*photos), std::vector<std::string>{}) << path;
    }

    const auto videos = resolver.locate("/Videos/");
    ASSERT_TRUE(videos);
    EXPECT_EQ(resolver.readdir(*videos), (std::vector<std::string>{"Clips"}));
}

TEST_F(ResolverTest, VideoOnlyTagHiddenFromPhotos) {
    const Resolver resolver(source, defaultFilters());
    EXPECT_FALSE(resolver.locate("/Photos/Clips"));
    EXPECT_TRUE(resolver.locate("/Videos/Clips/Only.mp4"));
}

TEST_F(ResolverTest, ListingAppliesFilterToImages) {
    const Resolver resolver(source, defaultFilters());

    const auto trip = resolver.locate("/Photos/Trip");
    ASSERT_TRUE(trip);
    EXPECT_EQ(resolver.readdir(*trip), (std::vector<std::string>{"Day", "Shot.jpg"}));

    const auto vtrip = resolver.locate("/Videos/Trip");
    ASSERT_TRUE(vtrip);
    EXPECT_EQ(resolver.readdir(*vtrip), (std::vector<std::string>{"Clip.mp4"}));

    EXPECT_FALSE(resolver.locate("/Photos/Trip/Clip.mp4"));
    EXPECT_FALSE(resolver.locate("/Videos/Trip/Day"));
}

TEST_F(ResolverTest, ImagesAreNotListable) {
    const Resolver resolver(source, defaultFilters());
    const auto img = resolver.locate("/Photos/Trip/Shot.jpg");
    ASSERT_TRUE(img);
    EXPECT_TRUE(img->node.isImage());
    EXPECT_FALSE(resolver.readdir(*img));
}

TEST_F(ResolverTest, WithoutFiltersTagsSitAtTheRoot) {
    const Resolver resolver(source, {});
    const auto root = resolver.locate("/");
    ASSERT_TRUE(root);
    EXPECT_EQ(resolver.readdir(*root), (std::vector<std::string>{"Clips", "Trip"}));
    EXPECT_TRUE(resolver.locate("/Trip/Clip.mp4"));
    EXPECT_TRUE(resolver.locate("/Trip/Day/Morning.jpg"));
}

TEST_F(ResolverTest, AllFilterShowsEverything) {
    const Resolver resolver(source, {Filter::fromConfig({"Everything", MediaKind::All})});
    const auto trip = resolver.locate("/Everything/Trip");
    ASSERT_TRUE(trip);
    EXPECT_EQ(resolver.readdir(*trip), (std::vector<std::string>{"Clip.mp4", "Day", "Shot.jpg"}));
}

TEST_F(ResolverTest, DuplicateFilterNamesRejected) {
    EXPECT_THROW(Resolver(source, {Filter::fromConfig({"A", MediaKind::Photos}), Filter::fromConfig({"A", MediaKind::Videos})}),
                 std::invalid_argument);
}

TEST_F(ResolverTest, FilterNeedsPredicate) {
    EXPECT_THROW(Filter("Broken", nullptr), std::invalid_argument);
}

TEST_F(ResolverTest, RelativePathThrows) {
    const Resolver resolver(source, defaultFilters());
    EXPECT_THROW((void)resolver.locate("Photos"), std::invalid_argument);
}
