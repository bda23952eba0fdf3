#include <gtest/gtest.h>

#include <fstream>

#include <unistd.h>

#include "pxid/core/host_id.hpp"
#include "pxid/core/identity_source.hpp"
#include "test_helpers.hpp"

using namespace pxid::core;
using namespace pxid::test;
using pxid::ErrorCode;

class IdentitySourceTest : public TempDirTest {
 protected:
  std::filesystem::path writeFile(const std::string& name, const std::string& content) {
    auto path = temp_dir_ / name;
    std::ofstream file(path);
    file << content;
    return path;
  }
};

TEST_F(IdentitySourceTest, MachineIdIsLeadingCrc32Bytes) {
  // crc32("test-host") == 0x494c8a9d
  EXPECT_EQ(machineIdFromHostId("test-host"), (MachineId{0x49, 0x4c, 0x8a}));
}

TEST_F(IdentitySourceTest, MachineIdIsStableAndInputSensitive) {
  EXPECT_EQ(machineIdFromHostId("host-a"), machineIdFromHostId("host-a"));
  EXPECT_NE(machineIdFromHostId("host-a"), machineIdFromHostId("host-b"));
}

TEST_F(IdentitySourceTest, ProcessIdKeepsLow16BitsBigEndian) {
  EXPECT_EQ(processIdFromPid(0x1234), (ProcessId{0x12, 0x34}));
  EXPECT_EQ(processIdFromPid(0xabcd1234), (ProcessId{0x12, 0x34}));
  EXPECT_EQ(processIdFromPid(0), (ProcessId{0x00, 0x00}));
}

TEST_F(IdentitySourceTest, FixedSourceReturnsGivenIdentity) {
  FixedIdentitySource source(testIdentity());

  auto identity = source.resolve();
  ASSERT_OK(identity);
  EXPECT_EQ(identity->machine_id, testIdentity().machine_id);
  EXPECT_EQ(identity->process_id, testIdentity().process_id);
}

TEST_F(IdentitySourceTest, HostIdOverrideIsHashed) {
  SystemIdentitySource::Options options;
  options.host_id = "test-host";
  SystemIdentitySource source(options);

  auto machine_id = source.resolveMachineId();
  ASSERT_OK(machine_id);
  EXPECT_EQ(*machine_id, machineIdFromHostId("test-host"));
}

TEST_F(IdentitySourceTest, MachineIdFileIsTrimmed) {
  SystemIdentitySource::Options options;
  options.machine_id_file = writeFile("machine-id", "  test-host\n");
  SystemIdentitySource source(options);

  auto machine_id = source.resolveMachineId();
  ASSERT_OK(machine_id);
  EXPECT_EQ(*machine_id, machineIdFromHostId("test-host"));
}

TEST_F(IdentitySourceTest, HostIdOverrideWinsOverFile) {
  SystemIdentitySource::Options options;
  options.host_id = "explicit";
  options.machine_id_file = writeFile("machine-id", "from-file\n");
  SystemIdentitySource source(options);

  auto machine_id = source.resolveMachineId();
  ASSERT_OK(machine_id);
  EXPECT_EQ(*machine_id, machineIdFromHostId("explicit"));
}

TEST_F(IdentitySourceTest, UnusableFileFallsBackToSystemLookup) {
  SystemIdentitySource::Options missing;
  missing.machine_id_file = temp_dir_ / "does-not-exist";

  SystemIdentitySource::Options blank;
  blank.machine_id_file = writeFile("blank", " \n\t\n");

  auto system = SystemIdentitySource().resolveMachineId();
  ASSERT_OK(system);

  auto from_missing = SystemIdentitySource(missing).resolveMachineId();
  ASSERT_OK(from_missing);
  EXPECT_EQ(*from_missing, *system);

  auto from_blank = SystemIdentitySource(blank).resolveMachineId();
  ASSERT_OK(from_blank);
  EXPECT_EQ(*from_blank, *system);
}

TEST_F(IdentitySourceTest, SystemProcessIdMatchesGetpid) {
  SystemIdentitySource source;

  auto process_id = source.resolveProcessId();
  ASSERT_OK(process_id);
  EXPECT_EQ(*process_id, processIdFromPid(static_cast<std::uint32_t>(getpid())));
}

TEST_F(IdentitySourceTest, SystemMachineIdIsStable) {
  auto first = SystemIdentitySource().resolveMachineId();
  auto second = SystemIdentitySource().resolveMachineId();

  ASSERT_OK(first);
  ASSERT_OK(second);
  EXPECT_EQ(*first, *second);
}

TEST_F(IdentitySourceTest, ReadHostIdReturnsNonBlankValue) {
  auto host_id = readHostId();

  ASSERT_OK(host_id);
  EXPECT_FALSE(host_id->empty());
  EXPECT_EQ(*host_id, trimHostId(*host_id));
}

TEST_F(IdentitySourceTest, TrimHostId) {
  EXPECT_EQ(trimHostId("abc\n"), "abc");
  EXPECT_EQ(trimHostId("\t abc def \r\n"), "abc def");
  EXPECT_EQ(trimHostId(" \n "), "");
  EXPECT_EQ(trimHostId(""), "");
}
