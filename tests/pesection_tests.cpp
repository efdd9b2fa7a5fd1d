#include <algorithm>
#include <peimage/pesection.hpp>
#include "testutils.hpp"

#include <gtest/gtest.h>

using namespace peimage;
using peimage_test::make_header;
using peimage_test::make_pattern;

namespace
{
    const DWORD TEXT_FLAGS = IMAGE_SCN_CNT_CODE | IMAGE_SCN_MEM_EXECUTE | IMAGE_SCN_MEM_READ;
    const DWORD DATA_FLAGS = IMAGE_SCN_CNT_INITIALIZED_DATA | IMAGE_SCN_MEM_READ | IMAGE_SCN_MEM_WRITE;
}

TEST(PE_Section, HeaderValuesSurviveSerialization) {
    const auto header = make_header(".text", 0x1234, 0x1000, 0x1400, 0x400, TEXT_FLAGS);
    pesection section(header);

    const auto out = section.toOnDiskHeader();
    EXPECT_EQ(out.VirtualSize, 0x1234u);
    EXPECT_EQ(out.VirtualAddress, 0x1000u);
    EXPECT_EQ(out.SizeOfRawData, 0x1400u);
    EXPECT_EQ(out.PointerToRawData, 0x400u);
    EXPECT_EQ(out.Characteristics, TEXT_FLAGS);
    EXPECT_TRUE(out == header);
}

TEST(PE_Section, BoundaryHeadersSurviveSerialization) {
    const image_section_header headers[] = {
        make_header(".one", 1, 0, 0, 0, 0),
        make_header(".top", 1, 0xFFFFFFFF, 0xFFFFFFFF, 0xFFFFFFFF, 0xFFFFFFFF),
        make_header("12345678", 0x10000, 0x7FFFF000, 0x200, 0x400, DATA_FLAGS),
        make_header("", 0x200, 0x1000, 0x200, 0x400, TEXT_FLAGS),
    };

    for (const auto &header : headers)
    {
        pesection section(header);
        const auto out = section.toOnDiskHeader();

        EXPECT_EQ(out.VirtualSize, header.VirtualSize);
        EXPECT_EQ(out.VirtualAddress, header.VirtualAddress);
        EXPECT_EQ(out.SizeOfRawData, header.SizeOfRawData);
        EXPECT_EQ(out.PointerToRawData, header.PointerToRawData);
        EXPECT_EQ(out.Characteristics, header.Characteristics);
        EXPECT_TRUE(out == header) << "section '" << header.getName() << "'";
    }
}

TEST(PE_Section, SetHeaderAllocatesVirtualSize) {
    pesection section(make_header(".data", 0x300, 0x2000, 0x200, 0x600, DATA_FLAGS));

    ASSERT_EQ(section.AllocatedSize(), 0x300u);
    for (size_t i = 0; i < section.AllocatedSize(); i++)
        ASSERT_EQ(section.data()[i], 0);
}

TEST(PE_Section, SetHeaderCopiesSourceData) {
    const auto source = make_pattern(0x40);
    pesection section(make_header(".rdata", 0x40, 0x3000, 0x40, 0x800, 0), source.data());

    ASSERT_EQ(section.AllocatedSize(), source.size());
    EXPECT_TRUE(std::equal(source.begin(), source.end(), section.data()));
}

TEST(PE_Section, ZeroVirtualSizeThrows) {
    EXPECT_THROW({ pesection empty(make_header(".bss", 0, 0x1000, 0, 0, 0)); }, section_error);

    pesection section(make_header(".bss", 0x10, 0x1000, 0, 0, 0));
    try {
        section.setHeader(make_header(".bss", 0, 0x1000, 0, 0, 0));
        FAIL() << "zero sized section accepted";
    }
    catch (const section_error &e) {
        EXPECT_EQ(e.code(), status::zero_size);
        EXPECT_TRUE(is_fatal(e.code()));
    }
}

TEST(PE_Section, SetHeaderWithoutDataChangeKeepsBuffer) {
    const auto source = make_pattern(0x20, 0x10);
    pesection section(make_header(".text", 0x20, 0x1000, 0x20, 0x400, TEXT_FLAGS), source.data());

    ASSERT_NO_THROW(section.setHeader(make_header(".code", 0, 0x5000, 0, 0, DATA_FLAGS), nullptr, false));

    EXPECT_EQ(section.Name(), ".code");
    EXPECT_EQ(section.VirtualSize(), 0u);
    EXPECT_EQ(section.VirtualAddress(), 0x5000u);
    EXPECT_EQ(section.Characteristics(), DATA_FLAGS);
    ASSERT_EQ(section.AllocatedSize(), 0x20u);
    EXPECT_TRUE(std::equal(source.begin(), source.end(), section.data()));
}

TEST(PE_Section, ContainsRVABounds) {
    pesection section(make_header(".text", 0x100, 0x1000, 0x200, 0x400, TEXT_FLAGS));

    EXPECT_TRUE(section.containsRVA(0x1000));
    EXPECT_TRUE(section.containsRVA(0x10FF));
    EXPECT_FALSE(section.containsRVA(0x1100));
    EXPECT_FALSE(section.containsRVA(0x0FFF));

    EXPECT_EQ(section.endRVA(), 0x1100u);
    EXPECT_EQ(section.lastRVA(), 0x10FFu);
    EXPECT_EQ(section.endRawOffset(), 0x600u);
}

TEST(PE_Section, ContainsRVAOneByteSection) {
    pesection section(make_header(".tiny", 1, 0x7000, 0, 0, 0));

    EXPECT_TRUE(section.containsRVA(0x7000));
    EXPECT_FALSE(section.containsRVA(0x7001));
    EXPECT_EQ(section.lastRVA(), 0x7000u);
}

TEST(PE_Section, ContainsRVAAtTopOfAddressSpace) {
    pesection section(make_header(".top", 0x10, 0xFFFFFFF0, 0, 0, 0));

    EXPECT_TRUE(section.containsRVA(0xFFFFFFFF));
    EXPECT_FALSE(section.containsRVA(0));
}

TEST(PE_Section, ClearDataKeepsVirtualValues) {
    pesection section(make_header(".data", 0x300, 0x2000, 0x200, 0x600, DATA_FLAGS));

    section.clearData();

    EXPECT_EQ(section.AllocatedSize(), 0u);
    EXPECT_EQ(section.data(), nullptr);
    EXPECT_EQ(section.RawSize(), 0u);
    EXPECT_EQ(section.RawOffset(), 0u);
    EXPECT_EQ(section.VirtualSize(), 0x300u);
    EXPECT_EQ(section.VirtualAddress(), 0x2000u);
    EXPECT_EQ(section.Characteristics(), DATA_FLAGS);
    EXPECT_EQ(section.Name(), ".data");
}

TEST(PE_Section, ResizeGrowPreservesPrefix) {
    const auto source = make_pattern(0x10, 1);
    pesection section(make_header(".data", 0x10, 0x2000, 0x10, 0x400, DATA_FLAGS), source.data());

    section.resize(0x30);

    EXPECT_EQ(section.RawSize(), 0x30u);
    EXPECT_EQ(section.VirtualSize(), 0x30u);
    ASSERT_EQ(section.AllocatedSize(), 0x30u);
    EXPECT_TRUE(std::equal(source.begin(), source.end(), section.data()));
    for (size_t i = 0x10; i < 0x30; i++)
        EXPECT_EQ(section.data()[i], 0) << "offset " << i;
}

TEST(PE_Section, ResizeShrinkKeepsHead) {
    const auto source = make_pattern(0x20, 1);
    pesection section(make_header(".data", 0x20, 0x2000, 0x20, 0x400, DATA_FLAGS), source.data());

    section.resize(0x8);

    EXPECT_EQ(section.RawSize(), 0x8u);
    EXPECT_EQ(section.VirtualSize(), 0x8u);
    ASSERT_EQ(section.AllocatedSize(), 0x8u);
    EXPECT_TRUE(std::equal(source.begin(), source.begin() + 8, section.data()));
    EXPECT_EQ(section.endRVA(), 0x2008u);
}

TEST(PE_Section, ResizeAfterClearReallocates) {
    pesection section(make_header(".data", 0x20, 0x2000, 0x20, 0x400, DATA_FLAGS));
    section.clearData();

    section.resize(0x40);

    ASSERT_EQ(section.AllocatedSize(), 0x40u);
    EXPECT_EQ(section.RawSize(), 0x40u);
    EXPECT_EQ(section.data()[0x3F], 0);
}

TEST(PE_Section, NameSafety) {
    pesection section(make_header(".text", 0x10, 0x1000, 0, 0, 0));
    EXPECT_TRUE(section.isNameSafe());

    section.setName("");
    EXPECT_FALSE(section.isNameSafe());

    section.setName("UPX 0");
    EXPECT_TRUE(section.isNameSafe());

    section.setName(std::string("ab\x01", 3));
    EXPECT_FALSE(section.isNameSafe());

    section.setName("\xE9t\xE9");
    EXPECT_FALSE(section.isNameSafe());

    section.setName("tab\there");
    EXPECT_FALSE(section.isNameSafe());

    section.setName("del\x7F");
    EXPECT_FALSE(section.isNameSafe());
}

TEST(PE_Section, GarbledHeaderNameIsUnsafe) {
    auto header = make_header("", 0x10, 0x1000, 0, 0, 0);
    header.Name = { { 0xFF, 0xFE, 'x', 0, 0, 0, 0, 0 } };

    pesection section(header);
    EXPECT_EQ(section.Name().size(), 3u);
    EXPECT_FALSE(section.isNameSafe());
}

TEST(PE_Section, CharacteristicQueries) {
    pesection text(make_header(".text", 0x10, 0x1000, 0, 0, TEXT_FLAGS));
    EXPECT_TRUE(text.isCode());
    EXPECT_TRUE(text.isExecutable());
    EXPECT_TRUE(text.isReadonly());

    pesection data(make_header(".data", 0x10, 0x2000, 0, 0, DATA_FLAGS));
    EXPECT_FALSE(data.isCode());
    EXPECT_FALSE(data.isExecutable());
    EXPECT_FALSE(data.isReadonly());

    data.setCharacteristics(IMAGE_SCN_CNT_CODE);
    EXPECT_TRUE(data.isCode());
}

TEST(PE_Section, LongNameIsTruncatedOnDisk) {
    pesection section(make_header(".text", 0x10, 0x1000, 0, 0, 0));
    section.setName(".verylongname");

    const auto header = section.toOnDiskHeader();
    EXPECT_EQ(header.getName(), ".verylon");
    EXPECT_EQ(header.Name[7], 'n');
}

TEST(PE_Section, ShortNameIsPaddedOnDisk) {
    pesection section(make_header(".a", 0x10, 0x1000, 0, 0, 0));

    const auto raw = section.toOnDiskHeader().serialize();
    EXPECT_EQ(raw[0], '.');
    EXPECT_EQ(raw[1], 'a');
    for (size_t i = 2; i < IMAGE_SIZEOF_SHORT_NAME; i++)
        EXPECT_EQ(raw[i], 0);
}

TEST(PE_Section, MemReadWriteByRVA) {
    pesection section(make_header(".data", 0x20, 0x2000, 0x20, 0x400, DATA_FLAGS));

    const BYTE bytes[] = { 0xDE, 0xAD, 0xBE, 0xEF };
    EXPECT_EQ(section.memwrite(bytes, sizeof(bytes), 0x2010), 4u);

    BYTE out[4] = {};
    EXPECT_EQ(section.memread(out, 0x2010, sizeof(out)), 4u);
    EXPECT_TRUE(std::equal(out, out + 4, bytes));
    EXPECT_EQ(section.data()[0x10], 0xDE);
}

TEST(PE_Section, MemReadWriteClampedToSection) {
    pesection section(make_header(".data", 0x20, 0x2000, 0x20, 0x400, DATA_FLAGS));

    const BYTE bytes[] = { 1, 2, 3, 4 };
    EXPECT_EQ(section.memwrite(bytes, sizeof(bytes), 0x201E), 2u);
    EXPECT_EQ(section.memwrite(bytes, sizeof(bytes), 0x2020), 0u);
    EXPECT_EQ(section.memwrite(bytes, sizeof(bytes), 0x1FFF), 0u);

    BYTE out[4] = {};
    EXPECT_EQ(section.memread(out, 0x201E, sizeof(out)), 2u);
    EXPECT_EQ(out[0], 1);
    EXPECT_EQ(out[1], 2);
    EXPECT_EQ(section.memread(out, 0x3000, sizeof(out)), 0u);
}

TEST(PE_Section, FillCoversAllocatedBlock) {
    pesection section(make_header(".text", 0x20, 0x1000, 0x20, 0x400, TEXT_FLAGS));

    section.fill(0xCC);

    for (size_t i = 0; i < section.AllocatedSize(); i++)
        ASSERT_EQ(section.data()[i], 0xCC);
}
