#include <gtest/gtest.h>
#include "trackmap/errors.hpp"
#include "trackmap/memory_store.hpp"

#include <algorithm>
#include <stdexcept>

using namespace trackmap;

class MemoryStoreTest : public ::testing::Test {
protected:
    MemoryCoordinationStore store;

    void SetUp() override {
        store.EnsurePath("/jobs");
    }

    static std::vector<std::string> Sorted(std::vector<std::string> v) {
        std::sort(v.begin(), v.end());
        return v;
    }
};

TEST_F(MemoryStoreTest, RootAlwaysExists) {
    MemoryCoordinationStore fresh;
    EXPECT_TRUE(fresh.Exists("/").has_value());
    EXPECT_TRUE(fresh.ListChildren("/").empty());
}

TEST_F(MemoryStoreTest, EnsurePathCreatesAncestors) {
    store.EnsurePath("/a/b/c");
    EXPECT_TRUE(store.Exists("/a").has_value());
    EXPECT_TRUE(store.Exists("/a/b").has_value());
    EXPECT_TRUE(store.Exists("/a/b/c").has_value());

    // Second call is a no-op
    Stamp next = store.NextStamp();
    store.EnsurePath("/a/b/c");
    EXPECT_EQ(store.NextStamp(), next);
}

TEST_F(MemoryStoreTest, StampsIncreaseAcrossNodes) {
    store.Create("/jobs/a", {1});
    store.Create("/jobs/b", {2});
    auto a = store.Exists("/jobs/a");
    auto b = store.Exists("/jobs/b");
    ASSERT_TRUE(a && b);
    EXPECT_LT(a->mzxid, b->mzxid);
    EXPECT_EQ(a->czxid, a->mzxid);
    EXPECT_EQ(a->version, 0);

    store.SetData("/jobs/a", {3});
    auto a2 = store.Exists("/jobs/a");
    EXPECT_GT(a2->mzxid, b->mzxid);
    EXPECT_EQ(a2->czxid, a->czxid);
    EXPECT_EQ(a2->version, 1);
    EXPECT_EQ(store.GetData("/jobs/a"), Bytes({3}));
}

TEST_F(MemoryStoreTest, ListChildrenReturnsDirectChildrenOnly) {
    store.Create("/jobs/x", {});
    store.Create("/jobs/y", {});
    store.Create("/jobs/x/nested", {});
    store.EnsurePath("/jobsother/z");

    EXPECT_EQ(Sorted(store.ListChildren("/jobs")), (std::vector<std::string>{"x", "y"}));
    EXPECT_EQ(store.CountChildren("/jobs"), 2u);
    EXPECT_EQ(store.Exists("/jobs")->num_children, 2u);
    EXPECT_EQ(Sorted(store.ListChildren("/")), (std::vector<std::string>{"jobs", "jobsother"}));
}

TEST_F(MemoryStoreTest, ListChildrenOfMissingNodeThrows) {
    EXPECT_THROW(store.ListChildren("/missing"), NoNodeError);
}

TEST_F(MemoryStoreTest, CreateErrors) {
    store.Create("/jobs/a", {});
    EXPECT_THROW(store.Create("/jobs/a", {}), NodeExistsError);
    EXPECT_THROW(store.Create("/nope/a", {}), NoNodeError);
}

TEST_F(MemoryStoreTest, DeleteErrors) {
    EXPECT_THROW(store.Delete("/jobs/missing"), NoNodeError);

    store.Create("/jobs/a", {});
    store.SetData("/jobs/a", {1});
    EXPECT_THROW(store.Delete("/jobs/a", 0), BadVersionError);
    EXPECT_NO_THROW(store.Delete("/jobs/a", 1));
    EXPECT_FALSE(store.Exists("/jobs/a").has_value());

    store.Create("/jobs/b", {});
    EXPECT_THROW(store.Delete("/jobs"), NotEmptyError);
}

TEST_F(MemoryStoreTest, DeleteUpdatesChildCount) {
    store.Create("/jobs/a", {});
    store.Create("/jobs/b", {});
    store.Delete("/jobs/a");
    EXPECT_EQ(store.CountChildren("/jobs"), 1u);
}

TEST_F(MemoryStoreTest, SetDataGuards) {
    EXPECT_THROW(store.SetData("/jobs/missing", {}), NoNodeError);
    store.Create("/jobs/a", {});
    EXPECT_THROW(store.SetData("/jobs/a", {1}, 3), BadVersionError);
    EXPECT_NO_THROW(store.SetData("/jobs/a", {1}, 0));
}

TEST_F(MemoryStoreTest, GetDataOfMissingNodeThrows) {
    EXPECT_THROW(store.GetData("/jobs/missing"), NoNodeError);
}

TEST_F(MemoryStoreTest, RejectsMalformedPaths) {
    EXPECT_THROW(store.Exists("relative"), std::invalid_argument);
    EXPECT_THROW(store.Create("/jobs/", {}), std::invalid_argument);
    EXPECT_THROW(store.Create("/jobs//a", {}), std::invalid_argument);
    EXPECT_THROW(store.Delete("/"), std::invalid_argument);
}
