/*
 * File:   Util_test.cpp
 * Author: me
 *
 * Created on March 21, 2024, 11:50 AM
 */

#include "sdsclient/Util.hpp"
#include "sdsclient/Errors.hpp"

#include <gtest/gtest.h>

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <sys/stat.h>
#include <string>

using namespace sdsclient;

TEST(UtilTest, DivideCeil)
{
    EXPECT_EQ(0u, Util::divideCeil(0, 5));
    EXPECT_EQ(1u, Util::divideCeil(5, 5));
    EXPECT_EQ(2u, Util::divideCeil(6, 5));
}

TEST(UtilTest, StrtoullReportsWhereParsingStopped)
{
    size_t index = 0;
    EXPECT_EQ(1234u, Util::strtoull("1234", index));
    EXPECT_EQ(std::string::npos, index);

    index = 6;
    EXPECT_EQ(99u, Util::strtoull("bytes 99-100", index));
    EXPECT_EQ(8u, index);
}

TEST(UtilTest, Rfc3339)
{
    EXPECT_EQ("1970-01-01T00:00:00Z", Util::epochTimeToRfc3339(0));
    EXPECT_EQ("2023-11-14T22:13:20Z", Util::epochTimeToRfc3339(1700000000));
}

TEST(UtilTest, Base64)
{
    EXPECT_EQ("Zm9vYg==", Util::base64Encode("foob"));
    EXPECT_EQ("foob", Util::base64Decode("Zm9vYg=="));
    EXPECT_EQ("", Util::base64Decode(""));
    EXPECT_THROW(Util::base64Decode("abc"), CryptoError);

    // 0xfb 0xff encodes to "+/8=" in the standard alphabet
    EXPECT_EQ("-_8", Util::base64UrlEncodeNoPad("\xfb\xff"));
}

TEST(UtilTest, FindHeaderIgnoresCaseAndTakesLastMatch)
{
    std::string raw =
            "HTTP/1.1 302 Found\r\n"
            "Location: https://elsewhere\r\n"
            "etag: \"first\"\r\n"
            "\r\n"
            "HTTP/1.1 200 OK\r\n"
            "ETag:  \"second\"  \r\n"
            "Content-Length: 12\r\n";
    EXPECT_EQ("\"second\"", Util::findHeader(raw, "ETag"));
    EXPECT_EQ("12", Util::findHeader(raw, "content-length"));
    EXPECT_EQ("", Util::findHeader(raw, "Retry-After"));
}

TEST(UtilTest, ContentRangeTotal)
{
    uint64_t total = 0;
    EXPECT_TRUE(Util::parseContentRangeTotal("bytes 0-0/1234", total));
    EXPECT_EQ(1234u, total);
    EXPECT_FALSE(Util::parseContentRangeTotal("bytes 0-0/*", total));
    EXPECT_FALSE(Util::parseContentRangeTotal("", total));
}

TEST(UtilTest, StripQuotesAndXml)
{
    EXPECT_EQ("abc", Util::stripQuotes("\"abc\""));
    EXPECT_EQ("abc", Util::stripQuotes("abc"));
    EXPECT_EQ("\"", Util::stripQuotes("\""));

    std::string xml = "<Error><Code>NoSuchKey</Code></Error>";
    EXPECT_EQ("NoSuchKey", Util::extractXmlElement(xml, "Code"));
    EXPECT_EQ("", Util::extractXmlElement(xml, "Message"));
}

TEST(UtilTest, XmlElementDecodesPredefinedEntities)
{
    std::string xml = "<Error><Message>a &lt;b&gt; &amp; &quot;c&quot; "
            "&apos;d&apos;</Message></Error>";
    EXPECT_EQ("a <b> & \"c\" 'd'", Util::extractXmlElement(xml, "Message"));

    // Decoded once, unknown references and bare ampersands stay
    EXPECT_EQ("&lt; &nbsp; & x",
            Util::extractXmlElement("<M>&amp;lt; &nbsp; & x</M>", "M"));
    EXPECT_EQ("&amp", Util::extractXmlElement("<M>&amp</M>", "M"));
}

TEST(UtilTest, RecursiveFopenCreatesParents)
{
    char dirTemplate[] = "/tmp/sdsclient-util-XXXXXX";
    ASSERT_TRUE(mkdtemp(dirTemplate) != NULL);
    std::string root = dirTemplate;
    std::string path = root + "/a/b/auth.json";

    FILE* file = Util::recursiveFopen(path, "w");
    ASSERT_TRUE(file != NULL) << "could not create " << path;
    fputs("{}", file);
    fclose(file);

    struct stat st;
    ASSERT_EQ(0, stat(path.c_str(), &st));
    EXPECT_EQ(0u, (unsigned) (st.st_mode & 077)) << "file must be owner-only";

    unlink(path.c_str());
    rmdir((root + "/a/b").c_str());
    rmdir((root + "/a").c_str());
    rmdir(root.c_str());
}
