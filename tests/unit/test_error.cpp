#include <gtest/gtest.h>
#include <string>
#include <tincture/error.hpp>

using namespace tincture;

TEST(Error, CarriesKindMessageAndSubject)
{
    Error e(ErrorKind::MissingExtra, "template 'vim' requires extra 'CONSTANT'", "CONSTANT");
    EXPECT_EQ(e.kind(), ErrorKind::MissingExtra);
    EXPECT_EQ(e.subject(), "CONSTANT");
    EXPECT_STREQ(e.what(), "template 'vim' requires extra 'CONSTANT'");
}

TEST(Error, SubjectDefaultsToEmpty)
{
    Error e(ErrorKind::InvalidParameter, "palette size must be positive");
    EXPECT_TRUE(e.subject().empty());
}

TEST(Error, CatchableAsRuntimeError)
{
    try
    {
        throw Error(ErrorKind::Io, "cannot open 'x'", "x");
    }
    catch (const std::runtime_error& e)
    {
        EXPECT_STREQ(e.what(), "cannot open 'x'");
        return;
    }
    FAIL() << "Error did not derive from std::runtime_error";
}

TEST(Error, KindNames)
{
    EXPECT_STREQ(error_kind_name(ErrorKind::InvalidParameter), "InvalidParameter");
    EXPECT_STREQ(error_kind_name(ErrorKind::InvalidExtras), "InvalidExtras");
    EXPECT_STREQ(error_kind_name(ErrorKind::DuplicateKey), "DuplicateKey");
    EXPECT_STREQ(error_kind_name(ErrorKind::TemplateParseError), "TemplateParseError");
    EXPECT_STREQ(error_kind_name(ErrorKind::MissingExtra), "MissingExtra");
    EXPECT_STREQ(error_kind_name(ErrorKind::SlotOutOfRange), "SlotOutOfRange");
    EXPECT_STREQ(error_kind_name(ErrorKind::InvalidDocument), "InvalidDocument");
    EXPECT_STREQ(error_kind_name(ErrorKind::Io), "Io");
}
