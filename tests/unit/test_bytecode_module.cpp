// File: tests/unit/test_bytecode_module.cpp
// Purpose: Verify the .rvm file layout written by writeModule and the
//          validation performed by readModule.
// Key invariants: Header fields are little-endian u32; each word occupies
//                 three bytes; the reader consumes the input exactly.
// Ownership/Lifetime: N/A (test).
// Links: src/bytecode/BytecodeModule.hpp

#include <gtest/gtest.h>

#include "bytecode/BytecodeModule.hpp"

#include <sstream>
#include <string>

using namespace regvm::bytecode;

namespace
{
std::string serialize(const BytecodeModule &module)
{
    std::ostringstream os;
    auto written = writeModule(module, os);
    EXPECT_TRUE(written);
    return os.str();
}
} // namespace

TEST(BytecodeModule, WritesHeaderAndWords)
{
    BytecodeModule module;
    module.code = {0x000001, 0x021302, 0x000000};
    const std::string bytes = serialize(module);

    const std::string expected("RVM\x01"
                               "\x01\x00\x00\x00"
                               "\x03\x00\x00\x00"
                               "\x01\x00\x00"
                               "\x02\x13\x02"
                               "\x00\x00\x00",
                               21);
    EXPECT_EQ(bytes, expected);
    EXPECT_TRUE(hasBytecodeMagic(bytes));
}

TEST(BytecodeModule, ReadsWhatWasWritten)
{
    BytecodeModule module;
    module.code = {0xFF4401, 0x00308B, 0x000000};
    auto read = readModule(serialize(module));
    ASSERT_TRUE(read);
    EXPECT_EQ(read.value().magic, kBytecodeModuleMagic);
    EXPECT_EQ(read.value().version, kBytecodeVersion);
    EXPECT_EQ(read.value().code, module.code);
}

TEST(BytecodeModule, EmptyModule)
{
    auto read = readModule(serialize(BytecodeModule{}));
    ASSERT_TRUE(read);
    EXPECT_TRUE(read.value().code.empty());
}

TEST(BytecodeModule, RejectsCorruptInput)
{
    BytecodeModule module;
    module.code = {0x000001, 0x000000};
    const std::string good = serialize(module);

    auto shortHeader = readModule(good.substr(0, 8));
    ASSERT_FALSE(shortHeader);
    EXPECT_EQ(shortHeader.error().message, "truncated bytecode header");

    std::string badMagic = good;
    badMagic[0] = 'X';
    EXPECT_FALSE(hasBytecodeMagic(badMagic));
    auto magic = readModule(badMagic);
    ASSERT_FALSE(magic);
    EXPECT_EQ(magic.error().message, "not a regvm bytecode file (bad magic)");

    std::string badVersion = good;
    badVersion[4] = '\x02';
    auto version = readModule(badVersion);
    ASSERT_FALSE(version);
    EXPECT_EQ(version.error().message, "unsupported bytecode version 2");

    auto truncated = readModule(good.substr(0, good.size() - 1));
    ASSERT_FALSE(truncated);
    EXPECT_EQ(truncated.error().message, "truncated bytecode body");

    auto trailing = readModule(good + "xy");
    ASSERT_FALSE(trailing);
    EXPECT_EQ(trailing.error().message, "2 trailing bytes after bytecode");

    std::string huge = good;
    huge[8] = '\x01';
    huge[9] = '\x10'; // 4097 words
    auto tooMany = readModule(huge);
    ASSERT_FALSE(tooMany);
    EXPECT_EQ(tooMany.error().message, "instruction count 4097 exceeds limit");
}

TEST(BytecodeModule, WriterRejectsWideWords)
{
    BytecodeModule module;
    module.code = {0x1000000};
    std::ostringstream os;
    auto written = writeModule(module, os);
    ASSERT_FALSE(written);
    EXPECT_EQ(written.error().message, "word 0 exceeds 24 bits");
    EXPECT_TRUE(os.str().empty());
}
