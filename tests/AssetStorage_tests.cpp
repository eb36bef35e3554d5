#include <gtest/gtest.h>
#include "assets/AssetStorage.hpp"

using namespace lplay;
using namespace lplay::assets;

namespace {
    VectorAsset lottie(const std::string& name) {
        return VectorAsset::make_lottie(name, playback::Composition{ 0.0f, 60.0f, 30.0f }, 100.0f, 100.0f);
    }
}

TEST(AssetStorage, AddAndGet) {
    AssetStorage storage;
    auto h = storage.add(lottie("intro"));

    EXPECT_TRUE(storage.validate(h));
    EXPECT_TRUE(storage.is_ready(h));
    EXPECT_EQ(storage.get(h).name, "intro");
    EXPECT_EQ(storage.size(), 1u);
    EXPECT_EQ(storage.find("intro"), h);
    EXPECT_EQ(storage.name_of(h), "intro");
}

TEST(AssetStorage, ReservedSlotIsValidButNotReady) {
    AssetStorage storage;
    auto h = storage.reserve("pending");

    EXPECT_TRUE(storage.validate(h));
    EXPECT_FALSE(storage.is_ready(h));
    EXPECT_EQ(storage.try_get(h), nullptr);
    EXPECT_THROW(storage.get(h), ValidationError);

    storage.load(h, lottie("ignored"));
    EXPECT_TRUE(storage.is_ready(h));
    // The reserved name wins over the name in the content
    EXPECT_EQ(storage.get(h).name, "pending");

    storage.unload(h);
    EXPECT_FALSE(storage.is_ready(h));
    EXPECT_TRUE(storage.validate(h));
}

TEST(AssetStorage, DuplicateNameThrows) {
    AssetStorage storage;
    storage.add(lottie("a"));
    EXPECT_THROW(storage.add(lottie("a")), std::invalid_argument);
}

TEST(AssetStorage, RemoveInvalidatesHandleAndRecyclesSlot) {
    AssetStorage storage;
    auto h0 = storage.add(lottie("a"));
    storage.remove(h0);

    EXPECT_FALSE(storage.validate(h0));
    EXPECT_FALSE(storage.find("a").has_value());
    EXPECT_EQ(storage.size(), 0u);
    EXPECT_THROW(storage.remove(h0), ValidationError);
    EXPECT_THROW(storage.load(h0, lottie("a")), ValidationError);

    auto h1 = storage.add(lottie("b"));
    EXPECT_EQ(h1.idx, h0.idx);
    EXPECT_NE(h1.ver, h0.ver);
    EXPECT_FALSE(storage.validate(h0));
    EXPECT_TRUE(storage.validate(h1));
}

TEST(AssetStorage, NullHandleIsInvalid) {
    AssetStorage storage;
    VectorAssetHandle h;
    EXPECT_FALSE(h);
    EXPECT_FALSE(storage.validate(h));
    EXPECT_EQ(storage.try_get(h), nullptr);
}

TEST(AssetStorage, ForEachReadySkipsUnloaded) {
    AssetStorage storage;
    storage.add(lottie("a"));
    storage.reserve("b");
    storage.add(lottie("c"));

    std::vector<std::string> names;
    storage.for_each_ready([&](VectorAssetHandle, VectorAsset& asset) { names.push_back(asset.name); });

    EXPECT_EQ(names, (std::vector<std::string>{ "a", "c" }));
}
