#include "tsync/core/error.hpp"
#include "tsync/core/result.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <system_error>

using tsync::classify_errno;
using tsync::classify_status;
using tsync::Error;
using tsync::ErrorKind;

TEST(ErrorTest, StatusCodesMapToKinds) {
    EXPECT_EQ(classify_status(404), ErrorKind::NotFound);
    EXPECT_EQ(classify_status(410), ErrorKind::NotFound);
    EXPECT_EQ(classify_status(423), ErrorKind::Transient);
    EXPECT_EQ(classify_status(500), ErrorKind::Transient);
    EXPECT_EQ(classify_status(503), ErrorKind::Transient);
    EXPECT_EQ(classify_status(403), ErrorKind::Io);
    EXPECT_EQ(classify_status(409), ErrorKind::Io);
}

TEST(ErrorTest, ErrnoValuesMapToKinds) {
    EXPECT_EQ(classify_errno(std::make_error_code(std::errc::no_such_file_or_directory)), ErrorKind::NotFound);
    EXPECT_EQ(classify_errno(std::make_error_code(std::errc::not_a_directory)), ErrorKind::NotFound);
    EXPECT_EQ(classify_errno(std::make_error_code(std::errc::timed_out)), ErrorKind::Transient);
    EXPECT_EQ(classify_errno(std::make_error_code(std::errc::connection_refused)), ErrorKind::Transient);
    EXPECT_EQ(classify_errno(std::make_error_code(std::errc::host_unreachable)), ErrorKind::Transient);
    EXPECT_EQ(classify_errno(std::error_code(ENOTCONN, std::system_category())), ErrorKind::Transient);
    EXPECT_EQ(classify_errno(std::make_error_code(std::errc::permission_denied)), ErrorKind::Io);
}

TEST(ErrorTest, ForeignCategoriesAreIo) {
    EXPECT_EQ(classify_errno(std::make_error_code(std::io_errc::stream)), ErrorKind::Io);
}

TEST(ErrorTest, ErrorFromStatusKeepsCode) {
    auto error = tsync::error_from_status(503, "PUT a.txt");
    EXPECT_TRUE(error.is_transient());
    EXPECT_EQ(error.status, 503);
    EXPECT_NE(error.message.find("PUT a.txt"), std::string::npos);
}

TEST(ErrorTest, ErrorFromCodeCarriesContext) {
    auto error = tsync::error_from_code(std::make_error_code(std::errc::no_such_file_or_directory), "stat x");
    EXPECT_TRUE(error.is_not_found());
    EXPECT_EQ(error.message.rfind("stat x: ", 0), 0u);
}

TEST(ResultTest, ValueAndErrorAccess) {
    tsync::Result<int> ok = tsync::Ok(7);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), 7);

    tsync::Result<int> failed = tsync::Err<int>(ErrorKind::Invalid, "bad");
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().kind, ErrorKind::Invalid);
    EXPECT_EQ(failed.value_or(3), 3);

    tsync::Result<void> done = tsync::Ok();
    EXPECT_TRUE(done.is_ok());
    tsync::Result<void> broken = tsync::Err<void>(Error{ErrorKind::Io, "disk", 0});
    EXPECT_TRUE(broken.is_error());
}
