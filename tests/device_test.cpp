#include "device.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace {

const std::vector<SDeviceInfo> MICE = {
    {"/dev/input/event3", "Logitech G Pro"},
    {"/dev/input/event7", "Razer Basilisk"},
    {"/dev/input/event11", "Logitech MX Master"},
};

SDeviceInfo pick(const std::vector<SDeviceInfo>& devices, std::optional<std::string> spec, const std::string& typed = "") {
    std::istringstream in(typed);
    std::ostringstream out;
    return selectDevice(devices, spec, in, out);
}

}

TEST(SelectDeviceTest, ByIndex) {
    EXPECT_EQ(pick(MICE, "1").path, "/dev/input/event3");
    EXPECT_EQ(pick(MICE, "3").path, "/dev/input/event11");
}

TEST(SelectDeviceTest, IndexOutOfRange) {
    EXPECT_THROW(pick(MICE, "0"), std::runtime_error);
    EXPECT_THROW(pick(MICE, "4"), std::runtime_error);
}

TEST(SelectDeviceTest, ByPath) {
    EXPECT_EQ(pick(MICE, "/dev/input/event7").name, "Razer Basilisk");
}

TEST(SelectDeviceTest, PathMustBeAKnownMouse) {
    EXPECT_THROW(pick(MICE, "/dev/input/event1"), std::runtime_error);
}

TEST(SelectDeviceTest, GarbageSpec) {
    EXPECT_THROW(pick(MICE, "mouse"), std::runtime_error);
    EXPECT_THROW(pick(MICE, "-1"), std::runtime_error);
}

TEST(SelectDeviceTest, SingleDeviceIsAutomatic) {
    const std::vector<SDeviceInfo> one = {MICE[1]};
    EXPECT_EQ(pick(one, std::nullopt).path, "/dev/input/event7");
}

TEST(SelectDeviceTest, AsksWhenSeveral) {
    std::istringstream in(" 2\n");
    std::ostringstream out;

    EXPECT_EQ(selectDevice(MICE, std::nullopt, in, out).path, "/dev/input/event7");
    EXPECT_NE(out.str().find("3. Logitech MX Master (/dev/input/event11)"), std::string::npos);
}

TEST(SelectDeviceTest, BadAnswer) {
    EXPECT_THROW(pick(MICE, std::nullopt, "nine\n"), std::runtime_error);
    EXPECT_THROW(pick(MICE, std::nullopt, "9\n"), std::runtime_error);
    EXPECT_THROW(pick(MICE, std::nullopt, ""), std::runtime_error);
}

TEST(SelectDeviceTest, NothingToChooseFrom) {
    EXPECT_THROW(pick({}, std::nullopt), std::runtime_error);
}

TEST(FilterByNameTest, KeepsSubstringMatches) {
    const auto out = filterByName(MICE, "Logitech");

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].path, "/dev/input/event3");
    EXPECT_EQ(out[1].path, "/dev/input/event11");
    EXPECT_TRUE(filterByName(MICE, "logitech").empty());
}

TEST(DeviceListTest, NumberedFromOne) {
    std::ostringstream out;
    printDeviceList({MICE[0], MICE[1]}, out);

    EXPECT_EQ(out.str(), "1. Logitech G Pro (/dev/input/event3)\n2. Razer Basilisk (/dev/input/event7)\n");
}

TEST(FindMouseDevicesTest, IgnoresNonEventNodes) {
    const auto dir = std::filesystem::temp_directory_path() / ("wheel-smoother-input-" + std::to_string(getpid()));
    std::filesystem::create_directories(dir);
    std::ofstream(dir / "mouse0").put('x');
    std::ofstream(dir / "js0").put('x');

    EXPECT_TRUE(findMouseDevices(dir.string()).empty());

    std::filesystem::remove_all(dir);
}
