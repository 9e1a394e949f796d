#include <gtest/gtest.h>
#include <managers/bssh_service.hpp>

TEST(BsshService, OperationsNeedConnection) {
    BsshService service;
    EXPECT_FALSE(service.is_connected());
    EXPECT_EQ(service.status_line(), "not connected");
    EXPECT_FALSE(service.has_shell());

    EXPECT_EQ(service.list("/").kind, ErrorKind::Transport);
    EXPECT_EQ(service.remove_file("/x").kind, ErrorKind::Transport);
    EXPECT_EQ(service.make_directory("/x").kind, ErrorKind::Transport);
    EXPECT_EQ(service.rename("/x", "/y").kind, ErrorKind::Transport);
    EXPECT_EQ(service.read_text("/x").kind, ErrorKind::Transport);
    EXPECT_EQ(service.exec("true").kind, ErrorKind::Transport);
    EXPECT_EQ(service.shell("/").kind, ErrorKind::Transport);
}

TEST(BsshService, DisconnectIsIdempotent) {
    BsshService service;
    service.disconnect();
    service.disconnect();
    EXPECT_FALSE(service.is_connected());
}
