#pragma once

#include "device/Enumerator.hpp"
#include "util/files.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace ferry::test {

namespace fs = std::filesystem;

class FakeEnumerator final : public device::Enumerator {
public:
    std::vector<device::Device> devices;
    mutable int topLevelCalls = 0;

    [[nodiscard]] std::vector<device::Device> list() const override { return devices; }

    [[nodiscard]] std::vector<std::string> topLevelFolders(const device::Device& device) const override {
        ++topLevelCalls;
        return Enumerator::topLevelFolders(device);
    }
};

inline void writeFile(const fs::path& path, const std::string& content = "x") {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

// A host working directory and a fake mounted phone side by side:
//
//   <root>/host/docs/report.pdf, notes.txt
//   <root>/gvfs/mtp:host=Pixel_7/Internal storage/Download/photo.jpg
//   <root>/gvfs/mtp:host=Pixel_7/Internal storage/DCIM/
class TreeTest : public ::testing::Test {
protected:
    fs::path root, host, gvfs, phone;
    device::Device pixel;
    FakeEnumerator enumerator;

    void SetUp() override {
        root = fs::temp_directory_path() / ("ferry_test_" + util::randomDigits(8));
        host = root / "host";
        gvfs = root / "gvfs";
        phone = gvfs / "mtp:host=Pixel_7";

        writeFile(host / "docs" / "report.pdf", "pdf");
        writeFile(host / "docs" / "notes.txt", "notes");
        writeFile(phone / "Internal storage" / "Download" / "photo.jpg", "jpeg");
        fs::create_directories(phone / "Internal storage" / "DCIM");

        pixel = {"Pixel 7", "mtp:host=Pixel_7", phone};
        enumerator.devices = {pixel};
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }
};

}
