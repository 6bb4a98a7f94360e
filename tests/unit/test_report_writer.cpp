#include <gtest/gtest.h>
#include "libnsdp/report/report_writer.h"
#include <cstdio>
#include <cstdlib>
#include <unistd.h>
#include <fstream>
#include <sstream>

using namespace libnsdp;

namespace {

ScanResult sampleResult() {
    ScanResult result;
    result.device.mac = "00:11:22:33:44:55";
    result.device.name = "lab-switch";
    result.device.model = "GS108Ev3";
    result.range = {0x0000, 0xFFFF};
    result.totalTested = 65536;
    result.totalValid = 2;
    result.duration = std::chrono::milliseconds(12345);
    result.scanTime = std::chrono::system_clock::from_time_t(0);
    result.findings.push_back({0x0C00, {0x01}});
    result.findings.push_back({0x7777, {0x00, 0x01, 0x02}});
    return result;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous

TEST(ReportWriter, PersistedLayout) {
    ReportWriter writer;
    std::ostringstream os;
    writer.writeReport(os, sampleResult());

    const std::string expected =
        "NSDP TLV Discovery Results\n"
        "==========================\n"
        "Scan Date: 1970-01-01 00:00:00 UTC\n"
        "Device MAC: 00:11:22:33:44:55\n"
        "Device Name: lab-switch\n"
        "Device Model: GS108Ev3\n"
        "Total TLVs Tested: 65536\n"
        "Valid TLVs Found: 2\n"
        "Success Rate: 0.00%\n"
        "Scan Duration: 12.345s\n"
        "\n"
        "Valid TLVs:\n"
        "-----------\n"
        "TLV: 0x0C00 (3072)\n"
        "Parameter: Port Status (Link/Speed)\n"
        "Length: 1 bytes\n"
        "Hex Data: 01\n"
        "Interpretation: Uint8: 1\n"
        "\n"
        "TLV: 0x7777 (30583)\n"
        "Length: 3 bytes\n"
        "Hex Data: 000102\n"
        "\n";
    EXPECT_EQ(os.str(), expected);
}

TEST(ReportWriter, UnknownIdentityFieldsOmitted) {
    ReportWriter writer;
    DeviceIdentity device;
    device.mac = "00:11:22:33:44:55";

    std::ostringstream os;
    writer.printIdentity(os, device);
    EXPECT_EQ(os.str(), "Device MAC: 00:11:22:33:44:55\n");
}

TEST(ReportWriter, EmptyCatalogStillReportsEveryFinding) {
    ParamCatalog empty;
    ReportWriter writer(empty);
    std::ostringstream os;
    writer.writeReport(os, sampleResult());

    EXPECT_FALSE(contains(os.str(), "Parameter:"));
    EXPECT_TRUE(contains(os.str(), "TLV: 0x0C00 (3072)\n"));
    EXPECT_TRUE(contains(os.str(), "TLV: 0x7777 (30583)\n"));
}

TEST(ReportWriter, ConsoleSummaryAndFindings) {
    ReportWriter writer;
    auto result = sampleResult();

    std::ostringstream summary;
    writer.printSummary(summary, result);
    EXPECT_TRUE(contains(summary.str(), "=== Scan Results ===\n"));
    EXPECT_TRUE(contains(summary.str(), "Total TLVs tested: 65536\n"));
    EXPECT_TRUE(contains(summary.str(), "Valid TLVs found: 2\n"));
    EXPECT_TRUE(contains(summary.str(), "Success rate: 0.00%\n"));
    EXPECT_TRUE(contains(summary.str(), "Scan duration: 12.345s\n"));

    std::ostringstream findings;
    writer.printFindings(findings, result);
    EXPECT_TRUE(contains(findings.str(),
        "0x0C00 ( 3072):   1 bytes - 01  [Port Status (Link/Speed)]\n"
        "                   Interpretation: Uint8: 1\n"));
    EXPECT_TRUE(contains(findings.str(), "0x7777 (30583):   3 bytes - 000102\n"));
}

TEST(ReportWriter, NoFindingsNoFindingSection) {
    ReportWriter writer;
    ScanResult result;
    std::ostringstream os;
    writer.printFindings(os, result);
    EXPECT_TRUE(os.str().empty());
}

TEST(ReportWriter, DevicePath) {
    EXPECT_EQ(ReportWriter::devicePath("out.txt", 1, 1), "out.txt");
    EXPECT_EQ(ReportWriter::devicePath("out.txt", 2, 3), "out_device2.txt");
    EXPECT_EQ(ReportWriter::devicePath("out", 2, 2), "out_device2");
    EXPECT_EQ(ReportWriter::devicePath("scans.d/out", 1, 2), "scans.d/out_device1");
    EXPECT_EQ(ReportWriter::devicePath("/tmp/.report", 3, 4), "/tmp/.report_device3");
    EXPECT_EQ(ReportWriter::devicePath("a.b.log", 1, 2), "a.b_device1.log");
}

TEST(ReportWriter, SaveAndReadBack) {
    ReportWriter writer;
    auto result = sampleResult();

    char tmpl[] = "/tmp/nsdp_report_XXXXXX";
    int fd = mkstemp(tmpl);
    ASSERT_GE(fd, 0);
    close(fd);

    ASSERT_TRUE(writer.saveReport(tmpl, result).ok());

    std::ifstream in(tmpl);
    std::stringstream saved;
    saved << in.rdbuf();

    std::ostringstream expected;
    writer.writeReport(expected, result);
    EXPECT_EQ(saved.str(), expected.str());

    std::remove(tmpl);
}

TEST(ReportWriter, SaveToUnwritablePath) {
    ReportWriter writer;
    auto r = writer.saveReport("/nonexistent-dir/sub/report.txt", sampleResult());
    EXPECT_EQ(r.code(), ErrorCode::ReportOpenFailed);
}

TEST(ReportWriter, DecodedValueOnParameterLine) {
    ReportWriter writer;
    ScanResult result = sampleResult();
    result.findings = {{0x2000, {0x04}}, {0x0C00, {0x01, 0x05, 0x00}}};

    std::ostringstream report;
    writer.writeReport(report, result);
    EXPECT_TRUE(contains(report.str(), "Parameter: VLAN Engine Mode = Advanced 802.1Q\n"));
    EXPECT_TRUE(contains(report.str(),
        "Parameter: Port Status (Link/Speed) = Port 1: Up (1000 Mbps)\n"));

    std::ostringstream console;
    writer.printFindings(console, result);
    EXPECT_TRUE(contains(console.str(), "  [VLAN Engine Mode = Advanced 802.1Q]\n"));
}
