/**
 * @file test_known_device_cache.cpp
 * @brief KnownDeviceCache updates, ordering and persistence.
 */
#include "utils/known_device_cache.hpp"
#include "shared_test_helpers.h"
#include "gtest/gtest.h"

#include <chrono>
#include <fstream>
#include <thread>

namespace fs = std::filesystem;
using namespace plushlink::utils;
using namespace plushlink::tests::helper;
using namespace std::chrono_literals;

namespace
{
constexpr const char *kAddrA = "AA:AA:AA:AA:AA:01";
constexpr const char *kAddrB = "BB:BB:BB:BB:BB:02";
constexpr const char *kAddrC = "CC:CC:CC:CC:CC:03";
} // namespace

class KnownDeviceCacheTest : public ::testing::Test
{
  protected:
    TempFileGuard files_;
    fs::path path_ = files_.add(unique_temp_path("known_devices", ".json"));
};

TEST_F(KnownDeviceCacheTest, StartsEmptyWithoutFile)
{
    KnownDeviceCache cache(path_, 10ms);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.most_recent().has_value());
    EXPECT_FALSE(cache.get(kAddrA).has_value());
}

TEST_F(KnownDeviceCacheTest, UpdateOnlyOverwritesProvidedFields)
{
    KnownDeviceCache cache(path_, 1h);
    cache.add_or_update(kAddrA, DeviceUpdate{.device_name = "Furby", .name = "Dah-Noh",
                                             .name_id = 7, .firmware_revision = "1.2"});
    const auto first = cache.get(kAddrA);
    ASSERT_TRUE(first.has_value());

    std::this_thread::sleep_for(5ms);
    const KnownDevice updated = cache.add_or_update(kAddrA, DeviceUpdate{.name = "Noo-Loo"});
    EXPECT_EQ(updated.name, "Noo-Loo");
    EXPECT_EQ(updated.device_name, "Furby");
    EXPECT_EQ(updated.name_id, 7);
    EXPECT_EQ(updated.firmware_revision, "1.2");
    EXPECT_GT(updated.last_seen, first->last_seen);
}

TEST_F(KnownDeviceCacheTest, GetAllIsNewestFirst)
{
    KnownDeviceCache cache(path_, 1h);
    cache.add_or_update(kAddrA);
    std::this_thread::sleep_for(5ms);
    cache.add_or_update(kAddrB);
    std::this_thread::sleep_for(5ms);
    cache.add_or_update(kAddrC);
    std::this_thread::sleep_for(5ms);
    cache.add_or_update(kAddrA); // seen again

    const auto all = cache.get_all();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].address, kAddrA);
    EXPECT_EQ(all[1].address, kAddrC);
    EXPECT_EQ(all[2].address, kAddrB);
    EXPECT_EQ(cache.most_recent()->address, kAddrA);
}

TEST_F(KnownDeviceCacheTest, RemoveClearAndAddresses)
{
    KnownDeviceCache cache(path_, 1h);
    cache.add_or_update(kAddrA);
    cache.add_or_update(kAddrB);
    EXPECT_EQ(cache.addresses().size(), 2u);

    EXPECT_TRUE(cache.remove(kAddrA));
    EXPECT_FALSE(cache.remove(kAddrA));
    ASSERT_EQ(cache.addresses().size(), 1u);
    EXPECT_EQ(cache.addresses()[0], kAddrB);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(KnownDeviceCacheTest, UpdateNameRequiresKnownDevice)
{
    KnownDeviceCache cache(path_, 1h);
    EXPECT_FALSE(cache.update_name(kAddrA, "Dah-Noh", 7));
    EXPECT_EQ(cache.size(), 0u);

    cache.add_or_update(kAddrA);
    EXPECT_TRUE(cache.update_name(kAddrA, "Dah-Noh", 7));
    const auto d = cache.get(kAddrA);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->name, "Dah-Noh");
    EXPECT_EQ(d->name_id, 7);
}

TEST_F(KnownDeviceCacheTest, FlushPersistsAcrossInstances)
{
    {
        KnownDeviceCache cache(path_, 1h);
        cache.add_or_update(kAddrA, DeviceUpdate{.device_name = "Furby", .name_id = 3});
        cache.add_or_update(kAddrB);
        EXPECT_TRUE(cache.flush());
    }
    KnownDeviceCache reloaded(path_, 1h);
    EXPECT_EQ(reloaded.size(), 2u);
    const auto a = reloaded.get(kAddrA);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->device_name, "Furby");
    EXPECT_EQ(a->name_id, 3);
    EXPECT_FALSE(a->name.has_value());
    EXPECT_FALSE(a->firmware_revision.has_value());
}

TEST_F(KnownDeviceCacheTest, DebouncedSaveLandsWithoutFlush)
{
    KnownDeviceCache cache(path_, 50ms);
    cache.add_or_update(kAddrA);
    std::string text;
    for (int i = 0; i < 100 && !fs::exists(path_); ++i)
        std::this_thread::sleep_for(10ms);
    ASSERT_TRUE(read_file_contents(path_, text));
    EXPECT_NE(text.find(kAddrA), std::string::npos);
}

TEST_F(KnownDeviceCacheTest, CorruptFileStartsEmpty)
{
    {
        std::ofstream out(path_);
        out << "{ \"devices\": ";
    }
    KnownDeviceCache cache(path_, 10ms);
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(KnownDeviceCacheTest, LoadsLegacyFurbiesTableAndRewritesIt)
{
    {
        std::ofstream out(path_);
        out << R"({"furbies": {"AA:AA:AA:AA:AA:01": {"address": "AA:AA:AA:AA:AA:01",
                  "device_name": "Furby", "name": "Dah-Noh", "name_id": 7,
                  "firmware_revision": null, "last_seen": 1700000000.5}}})";
    }
    {
        KnownDeviceCache cache(path_, 1h);
        ASSERT_EQ(cache.size(), 1u);
        const auto a = cache.get(kAddrA);
        ASSERT_TRUE(a.has_value());
        EXPECT_EQ(a->name, "Dah-Noh");
        EXPECT_EQ(a->name_id, 7);
        cache.add_or_update(kAddrB);
        EXPECT_TRUE(cache.flush());
    }
    std::string text;
    ASSERT_TRUE(read_file_contents(path_, text));
    EXPECT_NE(text.find("\"devices\""), std::string::npos);
    EXPECT_EQ(text.find("\"furbies\""), std::string::npos);
    KnownDeviceCache reloaded(path_, 1h);
    EXPECT_EQ(reloaded.size(), 2u);
}
