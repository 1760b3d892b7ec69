#include <gtest/gtest.h>

#include <sstream>

#include "errors.hpp"
#include "manifest/manifest_writer.hpp"
#include "test_utils.hpp"
#include "types.hpp"

using packager::IOError;
using packager::Manifest;
using packager::TypeGroup;
using packager::manifest::EscapeXml;
using packager::manifest::ManifestWriter;

namespace {

Manifest SampleManifest() {
    Manifest manifest;
    manifest.groups        = {TypeGroup {"ApexClass", {"Foo", "Bar"}}, TypeGroup {"ApexPage", {"Baz"}}};
    manifest.api_version   = "31.0";
    manifest.xml_namespace = "http://soap.sforce.com/2006/04/metadata";
    return manifest;
}

std::string Render(const Manifest& manifest) {
    std::ostringstream out;
    ManifestWriter::Write(manifest, out);
    return out.str();
}

}  // namespace

TEST(ManifestWriterTest, WritesExpectedDocument) {
    const std::string expected =
        "<?xml version=\"1.0\"?>\r\n"
        "<Package xmlns=\"http://soap.sforce.com/2006/04/metadata\">\r\n"
        "\t<types>\r\n"
        "\t\t<members>Foo</members>\r\n"
        "\t\t<members>Bar</members>\r\n"
        "\t\t<name>ApexClass</name>\r\n"
        "\t</types>\r\n"
        "\t<types>\r\n"
        "\t\t<members>Baz</members>\r\n"
        "\t\t<name>ApexPage</name>\r\n"
        "\t</types>\r\n"
        "\t<version>31.0</version>\r\n"
        "</Package>\r\n";

    EXPECT_EQ(Render(SampleManifest()), expected);
}

TEST(ManifestWriterTest, DeclarationHasNoEncoding) {
    auto xml = Render(SampleManifest());
    EXPECT_TRUE(xml.starts_with("<?xml version=\"1.0\"?>\r\n"));
    EXPECT_EQ(xml.find("encoding"), std::string::npos);
}

TEST(ManifestWriterTest, EveryLineEndsWithCrLf) {
    auto xml = Render(SampleManifest());
    for(size_t pos = xml.find('\n'); pos != std::string::npos; pos = xml.find('\n', pos + 1)) {
        ASSERT_GT(pos, 0);
        EXPECT_EQ(xml[pos - 1], '\r');
    }
}

TEST(ManifestWriterTest, EmptyManifestHasOnlyVersion) {
    Manifest manifest;
    manifest.api_version   = "45.0";
    manifest.xml_namespace = "urn:x";

    EXPECT_EQ(Render(manifest),
              "<?xml version=\"1.0\"?>\r\n<Package xmlns=\"urn:x\">\r\n\t<version>45.0</version>\r\n</Package>\r\n");
}

TEST(ManifestWriterTest, MembersAreNotSortedOrDeduplicated) {
    Manifest manifest = SampleManifest();
    manifest.groups   = {TypeGroup {"ApexClass", {"Zed", "Alpha", "Zed"}}};

    auto xml = Render(manifest);
    auto zed   = xml.find("<members>Zed</members>");
    auto alpha = xml.find("<members>Alpha</members>");
    ASSERT_NE(zed, std::string::npos);
    ASSERT_NE(alpha, std::string::npos);
    EXPECT_LT(zed, alpha);
    EXPECT_NE(xml.find("<members>Zed</members>", alpha), std::string::npos);
}

TEST(ManifestWriterTest, EscapesMarkupInText) {
    EXPECT_EQ(EscapeXml("A&B <c> \"d\" 'e'"), "A&amp;B &lt;c&gt; &quot;d&quot; &apos;e&apos;");

    Manifest manifest = SampleManifest();
    manifest.groups   = {TypeGroup {"R&D", {"a<b"}}};
    auto xml          = Render(manifest);
    EXPECT_NE(xml.find("\t\t<members>a&lt;b</members>\r\n"), std::string::npos);
    EXPECT_NE(xml.find("\t\t<name>R&amp;D</name>\r\n"), std::string::npos);
}

struct ManifestWriterFileTest: public TempDirTest {};

TEST_F(ManifestWriterFileTest, WritesFileAndRemovesTemporary) {
    const auto destination = root / "package.xml";

    ManifestWriter::Write(SampleManifest(), destination);

    EXPECT_EQ(ReadFile(destination), Render(SampleManifest()));
    EXPECT_FALSE(fs::exists(root / "package.xml.tmp"));
}

TEST_F(ManifestWriterFileTest, OverwritesExistingFile) {
    const auto destination = root / "package.xml";
    Touch("package.xml", "stale content that is longer than nothing at all");

    ManifestWriter::Write(SampleManifest(), destination);

    EXPECT_EQ(ReadFile(destination), Render(SampleManifest()));
}

TEST_F(ManifestWriterFileTest, UnwritableDestinationThrowsIOError) {
    const auto destination = root / "missing_dir" / "package.xml";

    EXPECT_THROW(ManifestWriter::Write(SampleManifest(), destination), IOError);
    EXPECT_FALSE(fs::exists(destination));
}

TEST_F(ManifestWriterFileTest, FailedRenameKeepsExistingTarget) {
    // Нельзя переименовать файл поверх непустой папки.
    Touch("package.xml/keep.txt", "keep");
    const auto destination = root / "package.xml";

    EXPECT_THROW(ManifestWriter::Write(SampleManifest(), destination), IOError);
    EXPECT_EQ(ReadFile(destination / "keep.txt"), "keep");
    EXPECT_FALSE(fs::exists(root / "package.xml.tmp"));
}
