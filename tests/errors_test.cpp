#include "editor/errors.hpp"

#include <string>
#include <system_error>

#include <gtest/gtest.h>

namespace kvedit {

TEST(EditorErrors, CategoryAndMessages) {
    const std::error_code ec = Errc::writer_busy;
    EXPECT_STREQ(ec.category().name(), "kv_editor");
    EXPECT_EQ(ec.value(), 3);
    EXPECT_EQ(ec.message(), "another write transaction is active");
    EXPECT_TRUE(ec);
    EXPECT_FALSE(std::error_code{});
}

TEST(EditorErrors, KindsCoverEveryCode) {
    EXPECT_EQ(error_kind(Errc::decode_failed),        ErrorKind::Decode);
    EXPECT_EQ(error_kind(Errc::no_write_transaction), ErrorKind::InvalidState);
    EXPECT_EQ(error_kind(Errc::writer_busy),          ErrorKind::InvalidState);
    EXPECT_EQ(error_kind(Errc::out_of_range),         ErrorKind::InvalidState);
    EXPECT_EQ(error_kind(Errc::store_io),             ErrorKind::StoreIO);
}

TEST(EditorErrors, ForeignCodesAreStoreIo) {
    EXPECT_EQ(error_kind(std::make_error_code(std::errc::io_error)), ErrorKind::StoreIO);
}

TEST(EditorErrors, KindNames) {
    EXPECT_EQ(to_string(ErrorKind::Decode),       "DecodeError");
    EXPECT_EQ(to_string(ErrorKind::InvalidState), "InvalidStateError");
    EXPECT_EQ(to_string(ErrorKind::StoreIO),      "StoreIOError");
}

} // namespace kvedit
