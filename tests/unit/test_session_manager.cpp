#include <gtest/gtest.h>
#include "peersend/transfer/session_manager.hpp"
#include <chrono>
#include <set>
#include <thread>

using namespace peersend::transfer;

class SessionManagerTest : public ::testing::Test {
protected:
    static std::vector<FileInfo> make_files(std::initializer_list<std::uint64_t> sizes) {
        std::vector<FileInfo> files;
        int index = 0;
        for (auto size : sizes) {
            FileInfo file;
            file.id = "file-" + std::to_string(index);
            file.name = "file" + std::to_string(index) + ".bin";
            file.size = size;
            file.file_type = "application/octet-stream";
            files.push_back(file);
            ++index;
        }
        return files;
    }
    
    SessionManager manager_;
};

TEST_F(SessionManagerTest, CreateAndLookup) {
    auto session = manager_.create_session("sender", "receiver", make_files({100, 200}));
    
    ASSERT_NE(session, nullptr);
    EXPECT_FALSE(session->id().empty());
    EXPECT_EQ(session->sender_id(), "sender");
    EXPECT_EQ(session->receiver_id(), "receiver");
    EXPECT_EQ(session->total_bytes(), 300u);
    EXPECT_EQ(session->status(), SessionStatus::WAITING);
    
    EXPECT_EQ(manager_.get_session(session->id()), session);
    EXPECT_EQ(manager_.get_session("unknown"), nullptr);
    EXPECT_EQ(manager_.session_count(), 1u);
}

TEST_F(SessionManagerTest, SessionIdsAreUnique) {
    std::set<std::string> ids;
    for (int i = 0; i < 50; ++i) {
        ids.insert(manager_.create_session("s", "r", make_files({1}))->id());
    }
    EXPECT_EQ(ids.size(), 50u);
    EXPECT_EQ(manager_.get_all_sessions().size(), 50u);
}

TEST_F(SessionManagerTest, RemoveSessionClearsKey) {
    auto session = manager_.create_session("s", "r", make_files({10}));
    peersend::crypto::SymmetricKey key;
    key.fill(0x5A);
    session->set_session_key(key);
    
    manager_.remove_session(session->id());
    
    EXPECT_EQ(manager_.session_count(), 0u);
    EXPECT_FALSE(session->session_key().has_value());
    
    // Unknown ids are ignored
    manager_.remove_session("unknown");
}

TEST_F(SessionManagerTest, HappyPathTransitions) {
    auto session = manager_.create_session("s", "r", make_files({10}));
    
    EXPECT_TRUE(session->start_transfer());
    EXPECT_EQ(session->status(), SessionStatus::TRANSFERRING);
    EXPECT_FALSE(session->start_transfer());
    
    EXPECT_TRUE(session->add_bytes(10));
    EXPECT_TRUE(session->finish());
    EXPECT_EQ(session->status(), SessionStatus::FINISHED);
    EXPECT_DOUBLE_EQ(session->progress_fraction(), 1.0);
}

TEST_F(SessionManagerTest, FinishRequiresTransferUnlessEmpty) {
    auto session = manager_.create_session("s", "r", make_files({10}));
    EXPECT_FALSE(session->finish());
    EXPECT_EQ(session->status(), SessionStatus::WAITING);
    
    auto empty = manager_.create_session("s", "r", make_files({0}));
    EXPECT_DOUBLE_EQ(empty->progress_fraction(), 0.0);
    EXPECT_TRUE(empty->finish());
    EXPECT_DOUBLE_EQ(empty->progress_fraction(), 1.0);
}

TEST_F(SessionManagerTest, TerminalStatesAreSticky) {
    auto finished = manager_.create_session("s", "r", make_files({1}));
    finished->start_transfer();
    finished->finish();
    EXPECT_FALSE(finished->cancel());
    EXPECT_FALSE(finished->fail(ErrorCause::IO_FAILURE, "late"));
    EXPECT_EQ(finished->status(), SessionStatus::FINISHED);
    
    auto cancelled = manager_.create_session("s", "r", make_files({1}));
    EXPECT_TRUE(cancelled->cancel());
    EXPECT_TRUE(cancelled->cancel_requested());
    EXPECT_FALSE(cancelled->start_transfer());
    EXPECT_FALSE(cancelled->fail(ErrorCause::TIMEOUT, "late"));
    EXPECT_EQ(cancelled->status(), SessionStatus::CANCELLED);
    
    auto failed = manager_.create_session("s", "r", make_files({1}));
    EXPECT_TRUE(failed->fail(ErrorCause::CRYPTO_FAILURE, "bad tag"));
    EXPECT_FALSE(failed->cancel());
    EXPECT_FALSE(failed->fail(ErrorCause::IO_FAILURE, "second failure"));
    
    auto state = failed->state();
    EXPECT_EQ(state.status, SessionStatus::ERROR);
    ASSERT_TRUE(state.cause.has_value());
    EXPECT_EQ(*state.cause, ErrorCause::CRYPTO_FAILURE);
    EXPECT_EQ(state.detail, "bad tag");
}

TEST_F(SessionManagerTest, ProgressIsMonotonicAndBounded) {
    auto session = manager_.create_session("s", "r", make_files({100, 50}));
    session->start_transfer();
    
    double last = session->progress_fraction();
    for (int i = 0; i < 15; ++i) {
        EXPECT_TRUE(session->add_bytes(10));
        double current = session->progress_fraction();
        EXPECT_GE(current, last);
        last = current;
    }
    
    EXPECT_DOUBLE_EQ(last, 1.0);
    EXPECT_FALSE(session->add_bytes(1));
    
    auto progress = session->progress();
    EXPECT_EQ(progress.bytes_transferred, 150u);
    EXPECT_EQ(progress.total_bytes, 150u);
    EXPECT_GE(progress.speed_bytes_per_sec, 0.0);
}

TEST_F(SessionManagerTest, CleanupExpiredFailsIdleSessionsWithTimeout) {
    auto idle = manager_.create_session("s", "r", make_files({10}));
    auto done = manager_.create_session("s", "r", make_files({10}));
    done->start_transfer();
    done->add_bytes(10);
    done->finish();
    
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    
    EXPECT_EQ(manager_.cleanup_expired(std::chrono::seconds(0)), 1u);
    
    auto state = idle->state();
    EXPECT_EQ(state.status, SessionStatus::ERROR);
    ASSERT_TRUE(state.cause.has_value());
    EXPECT_EQ(*state.cause, ErrorCause::TIMEOUT);
    EXPECT_EQ(done->status(), SessionStatus::FINISHED);
    
    // Already terminal, nothing left to expire
    EXPECT_EQ(manager_.cleanup_expired(std::chrono::seconds(0)), 0u);
}

TEST_F(SessionManagerTest, CleanupExpiredSparesActiveSessions) {
    auto session = manager_.create_session("s", "r", make_files({10}));
    EXPECT_EQ(manager_.cleanup_expired(std::chrono::seconds(300)), 0u);
    EXPECT_EQ(session->status(), SessionStatus::WAITING);
}

TEST_F(SessionManagerTest, RemoveFinishedSessions) {
    auto active = manager_.create_session("s", "r", make_files({10}));
    auto cancelled = manager_.create_session("s", "r", make_files({10}));
    auto failed = manager_.create_session("s", "r", make_files({10}));
    cancelled->cancel();
    failed->fail(ErrorCause::IO_FAILURE, "disk full");
    
    EXPECT_EQ(manager_.remove_finished_sessions(), 2u);
    EXPECT_EQ(manager_.session_count(), 1u);
    EXPECT_EQ(manager_.get_session(active->id()), active);
}

TEST_F(SessionManagerTest, RemoteSessionIdAndToken) {
    auto session = manager_.create_session("s", "r", make_files({10}));
    session->set_remote_session_id("remote-1");
    session->set_token("abc");
    
    EXPECT_EQ(session->remote_session_id(), "remote-1");
    EXPECT_EQ(session->token(), "abc");
    EXPECT_FALSE(session->session_key().has_value());
}

TEST_F(SessionManagerTest, FindFile) {
    auto session = manager_.create_session("s", "r", make_files({10, 20}));
    
    auto file = session->find_file("file-1");
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->size, 20u);
    EXPECT_FALSE(session->find_file("file-9").has_value());
}
