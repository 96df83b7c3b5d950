#include <gtest/gtest.h>
#include "seedkeeper/cleanup/cleanup_service.hpp"
#include "support/fake_transfer_client.hpp"
#include <boost/asio.hpp>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace seedkeeper;
using namespace seedkeeper::cleanup;
using namespace seedkeeper::client;
using namespace seedkeeper::test_support;
using namespace std::chrono_literals;

class CleanupServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "seedkeeper_cleanup_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        
        settings_.cleanup_enabled = true;
        settings_.cleanup_cooldown = 0ms;
        settings_.cleanup_reannounce_wait = 0ms;
        settings_.cleanup_directive_file = test_dir_ / "cleanup_tasks.json";
        settings_.database_path = test_dir_ / "state.db";
        
        fake_ = std::make_shared<FakeTransferClient>();
        fake_->set_free_space(4 * GiB);
        session_ = std::make_shared<ClientSession>(fake_, 4, 1000ms);
        store_ = std::make_shared<storage::StateStore>(settings_.database_path);
        ASSERT_TRUE(store_->initialize());
        events_ = std::make_shared<scheduler::EventChannel>();
        
        work_.emplace(boost::asio::make_work_guard(io_context_));
        io_thread_ = std::thread([this] { io_context_.run(); });
    }
    
    void TearDown() override {
        if (service_) {
            service_->shutdown();
            service_->wait_idle(2s);
        }
        work_.reset();
        io_context_.stop();
        if (io_thread_.joinable()) {
            io_thread_.join();
        }
        service_.reset();
        store_.reset();
        std::filesystem::remove_all(test_dir_);
    }
    
    std::shared_ptr<CleanupService> start() {
        provider_ = std::make_shared<core::SettingsProvider>(settings_);
        service_ = std::make_shared<CleanupService>(io_context_, session_, store_, events_, provider_);
        return service_;
    }
    
    TransferSnapshot named(const std::string& hash, const std::string& name, uint64_t upload_rate) {
        auto transfer = make_transfer(hash, TransferState::UPLOADING, 1.0, upload_rate);
        transfer.name = name;
        return transfer;
    }
    
    bool has_event(scheduler::EventSeverity severity, const std::string& fragment) {
        for (const auto& event : events_->drain()) {
            if (event.severity == severity && event.message.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }
    
    std::filesystem::path test_dir_;
    core::Settings settings_;
    
    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::thread io_thread_;
    
    std::shared_ptr<FakeTransferClient> fake_;
    std::shared_ptr<ClientSession> session_;
    std::shared_ptr<storage::StateStore> store_;
    std::shared_ptr<scheduler::EventChannel> events_;
    std::shared_ptr<core::SettingsProvider> provider_;
    std::shared_ptr<CleanupService> service_;
};

TEST_F(CleanupServiceTest, RecordsRuleSnapshotOnFirstCycle) {
    auto service = start();
    EXPECT_FALSE(store_->latest_rule_snapshot().has_value());
    
    service->trigger();
    ASSERT_TRUE(service->wait_idle(5s));
    
    auto snapshot = store_->latest_rule_snapshot();
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(*snapshot, CleanupRules::from_settings(settings_).serialize());
}

TEST_F(CleanupServiceTest, DeletesOneAtATimeUntilNothingMatches) {
    fake_->set_transfers({
        named("a", "slow-a", 100 * KiB),
        named("fast", "fast", 6000 * KiB),
        named("b", "slow-b", 200 * KiB),
    });
    auto service = start();
    
    service->trigger();
    ASSERT_TRUE(service->wait_idle(5s));
    
    auto removed = fake_->removed();
    ASSERT_EQ(removed.size(), 2u);
    EXPECT_EQ(removed[0].first, "a");
    EXPECT_EQ(removed[1].first, "b");
    EXPECT_FALSE(removed[0].second);
    EXPECT_EQ(fake_->reannounced(), (std::vector<std::string>{"a", "b"}));
    
    auto status = service->status();
    EXPECT_EQ(status.deleted, 2u);
    EXPECT_EQ(status.abandoned, 0u);
    EXPECT_FALSE(status.in_progress);
    EXPECT_FALSE(status.pending.has_value());
    
    auto actions = store_->recent_actions(10);
    ASSERT_EQ(actions.size(), 2u);
    EXPECT_EQ(actions[0].action, "delete");
    EXPECT_EQ(actions[0].hash, "b");
    EXPECT_EQ(actions[0].tier, 3);
    EXPECT_EQ(actions[0].reason.rfind("tier3", 0), 0u);
    EXPECT_TRUE(has_event(scheduler::EventSeverity::INFO, "Deleted slow-a"));
}

TEST_F(CleanupServiceTest, HonoursDeleteFilesPolicy) {
    settings_.cleanup_delete_files = true;
    fake_->set_transfers({named("a", "slow-a", 0)});
    auto service = start();
    
    service->trigger();
    ASSERT_TRUE(service->wait_idle(5s));
    
    ASSERT_EQ(fake_->removed().size(), 1u);
    EXPECT_TRUE(fake_->removed()[0].second);
    EXPECT_TRUE(store_->recent_actions(1)[0].delete_files);
}

TEST_F(CleanupServiceTest, SkipsReannounceWhenDisabled) {
    settings_.cleanup_reannounce_before_delete = false;
    fake_->set_transfers({named("a", "slow-a", 0)});
    auto service = start();
    
    service->trigger();
    ASSERT_TRUE(service->wait_idle(5s));
    
    EXPECT_TRUE(fake_->reannounced().empty());
    EXPECT_EQ(fake_->removed().size(), 1u);
}

TEST_F(CleanupServiceTest, DisabledServiceDoesNothing) {
    settings_.cleanup_enabled = false;
    fake_->set_transfers({named("a", "slow-a", 0)});
    auto service = start();
    
    service->trigger();
    ASSERT_TRUE(service->wait_idle(5s));
    
    EXPECT_TRUE(fake_->removed().empty());
    EXPECT_EQ(fake_->list_calls.load(), 0);
}

TEST_F(CleanupServiceTest, UnknownFreeSpaceDeletesNothing) {
    fake_->set_free_space(std::nullopt);
    fake_->set_transfers({named("a", "slow-a", 0)});
    auto service = start();
    
    service->trigger();
    ASSERT_TRUE(service->wait_idle(5s));
    
    EXPECT_TRUE(fake_->removed().empty());
}

TEST_F(CleanupServiceTest, AbandonsWhenProtectedDuringWait) {
    settings_.cleanup_reannounce_wait = 300ms;
    fake_->set_transfers({named("a", "slow-a", 0)});
    auto service = start();
    
    service->trigger();
    std::this_thread::sleep_for(100ms);
    auto status = service->status();
    ASSERT_TRUE(status.pending.has_value());
    EXPECT_EQ(status.pending->phase, DeletionPhase::WAITING);
    EXPECT_TRUE(status.pending->reannounce_issued);
    
    ASSERT_TRUE(service->protect("a"));
    ASSERT_TRUE(service->wait_idle(5s));
    
    EXPECT_TRUE(fake_->removed().empty());
    EXPECT_EQ(service->status().abandoned, 1u);
    
    auto actions = store_->recent_actions(10);
    ASSERT_EQ(actions.size(), 2u);
    EXPECT_EQ(actions[0].action, "abandon");
    EXPECT_EQ(actions[1].action, "protect");
    EXPECT_TRUE(has_event(scheduler::EventSeverity::WARNING, "protected while pending"));
}

TEST_F(CleanupServiceTest, AbandonsWhenTransferVanishes) {
    settings_.cleanup_reannounce_wait = 300ms;
    fake_->set_transfers({named("a", "slow-a", 0)});
    auto service = start();
    
    service->trigger();
    std::this_thread::sleep_for(100ms);
    fake_->set_transfers({});
    ASSERT_TRUE(service->wait_idle(5s));
    
    EXPECT_TRUE(fake_->removed().empty());
    EXPECT_EQ(service->status().abandoned, 1u);
    EXPECT_NE(service->status().last_action.find("no longer present"), std::string::npos);
}

TEST_F(CleanupServiceTest, RemoveFailureCoolsDownAndReevaluates) {
    fake_->set_transfers({named("a", "slow-a", 0)});
    fake_->fail_next("remove", ClientErrorKind::TRANSIENT);
    auto service = start();
    
    service->trigger();
    ASSERT_TRUE(service->wait_idle(5s));
    
    // Same cycle: the failed step cools down, then the fresh snapshot selects it again.
    ASSERT_EQ(fake_->removed().size(), 1u);
    EXPECT_EQ(fake_->removed()[0].first, "a");
    EXPECT_EQ(service->status().abandoned, 1u);
    EXPECT_EQ(service->status().deleted, 1u);
    
    auto actions = store_->recent_actions(10);
    ASSERT_EQ(actions.size(), 2u);
    EXPECT_EQ(actions[0].action, "delete");
    EXPECT_EQ(actions[1].action, "abandon");
}

TEST_F(CleanupServiceTest, ShutdownCutsCooldownShort) {
    settings_.cleanup_cooldown = 30s;
    fake_->set_transfers({named("a", "slow-a", 0), named("b", "slow-b", 0)});
    auto service = start();
    
    service->trigger();
    for (int i = 0; i < 500 && fake_->removed().empty(); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_EQ(fake_->removed().size(), 1u);
    
    service->shutdown();
    EXPECT_TRUE(service->wait_idle(2s));
    EXPECT_EQ(fake_->removed().size(), 1u);
    EXPECT_FALSE(service->status().in_progress);
}

TEST_F(CleanupServiceTest, ShutdownLetsReannounceWaitFinish) {
    settings_.cleanup_reannounce_wait = 300ms;
    fake_->set_transfers({named("a", "slow-a", 0)});
    auto service = start();
    
    service->trigger();
    for (int i = 0; i < 500 && fake_->reannounced().empty(); ++i) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(fake_->reannounced().size(), 1u);
    
    service->shutdown();
    ASSERT_TRUE(service->wait_idle(3s));
    ASSERT_EQ(fake_->removed().size(), 1u);
    EXPECT_EQ(fake_->removed()[0].first, "a");
}

TEST_F(CleanupServiceTest, ProtectedTransfersSurviveCleanup) {
    fake_->set_transfers({named("keep", "keep", 0), named("drop", "drop", 0)});
    ASSERT_TRUE(store_->protect("keep"));
    auto service = start();
    
    service->trigger();
    ASSERT_TRUE(service->wait_idle(5s));
    
    ASSERT_EQ(fake_->removed().size(), 1u);
    EXPECT_EQ(fake_->removed()[0].first, "drop");
}

TEST_F(CleanupServiceTest, ManualDeleteRefusedWhenProtected) {
    fake_->set_transfers({named("a", "slow-a", 0)});
    settings_.cleanup_enabled = false;
    auto service = start();
    ASSERT_TRUE(service->protect("a"));
    
    std::string error;
    EXPECT_FALSE(service->request_delete("a", true, "operator", error));
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(service->status().manual_queued, 0u);
}

TEST_F(CleanupServiceTest, ManualDeleteRunsWhileDisabled) {
    settings_.cleanup_enabled = false;
    fake_->set_transfers({named("a", "fast-a", 9000 * KiB)});
    auto service = start();
    
    std::string error;
    ASSERT_TRUE(service->request_delete("a", true, "operator request", error));
    ASSERT_TRUE(service->wait_idle(5s));
    
    ASSERT_EQ(fake_->removed().size(), 1u);
    EXPECT_TRUE(fake_->removed()[0].second);
    
    auto actions = store_->recent_actions(1);
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].tier, 0);
    EXPECT_EQ(actions[0].reason, "manual: operator request");
}

TEST_F(CleanupServiceTest, ManualDeleteOfUnknownHashIsDropped) {
    settings_.cleanup_enabled = false;
    fake_->set_transfers({named("a", "slow-a", 0)});
    auto service = start();
    
    std::string error;
    ASSERT_TRUE(service->request_delete("ghost", std::nullopt, "", error));
    ASSERT_TRUE(service->wait_idle(5s));
    
    EXPECT_TRUE(fake_->removed().empty());
    EXPECT_EQ(service->status().manual_queued, 0u);
}

TEST_F(CleanupServiceTest, DeleteByNameExpandsToUnprotectedMatches) {
    settings_.cleanup_enabled = false;
    fake_->set_transfers({
        named("s1", "Show.S01.1080p", 9000 * KiB),
        named("s2", "show.s02.720p", 9000 * KiB),
        named("m", "Movie.2020", 9000 * KiB),
    });
    ASSERT_TRUE(store_->protect("s2"));
    auto service = start();
    
    service->request_delete_by_name("SHOW", std::nullopt, "season done");
    ASSERT_TRUE(service->wait_idle(5s));
    
    auto removed = fake_->removed();
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0].first, "s1");
}

TEST_F(CleanupServiceTest, ProcessesDirectiveFile) {
    settings_.cleanup_enabled = false;
    fake_->set_transfers({named("a", "slow-a", 0), named("b", "slow-b", 0)});
    {
        std::ofstream file(settings_.cleanup_directive_file);
        file << "{\"action\": \"protect\", \"hash\": \"a\"}\n";
        file << "{\"action\": \"delete\", \"hash\": \"a\"}\n";
        file << "{\"action\": \"delete\", \"hash\": \"b\", \"delete_files\": true}\n";
        file << "{\"action\": \"launch\"}\n";
    }
    auto service = start();
    
    EXPECT_EQ(service->process_directives(), 3u);
    ASSERT_TRUE(service->wait_idle(5s));
    
    EXPECT_TRUE(store_->is_protected("a"));
    ASSERT_EQ(fake_->removed().size(), 1u);
    EXPECT_EQ(fake_->removed()[0].first, "b");
    EXPECT_TRUE(fake_->removed()[0].second);
    EXPECT_FALSE(std::filesystem::exists(settings_.cleanup_directive_file));
    
    auto events = events_->drain();
    size_t warnings = 0;
    for (const auto& event : events) {
        if (event.severity == scheduler::EventSeverity::WARNING) {
            warnings++;
        }
    }
    EXPECT_EQ(warnings, 2u);
}

TEST_F(CleanupServiceTest, UnprotectRestoresEligibility) {
    fake_->set_transfers({named("a", "slow-a", 0)});
    ASSERT_TRUE(store_->protect("a"));
    auto service = start();
    
    service->trigger();
    ASSERT_TRUE(service->wait_idle(5s));
    EXPECT_TRUE(fake_->removed().empty());
    
    ASSERT_TRUE(service->unprotect("a"));
    service->trigger();
    ASSERT_TRUE(service->wait_idle(5s));
    EXPECT_EQ(fake_->removed().size(), 1u);
}

TEST_F(CleanupServiceTest, ShutdownRefusesNewCycles) {
    fake_->set_transfers({named("a", "slow-a", 0)});
    auto service = start();
    
    service->shutdown();
    service->trigger();
    
    EXPECT_TRUE(service->wait_idle(1s));
    EXPECT_TRUE(fake_->removed().empty());
}

TEST_F(CleanupServiceTest, ReloadedRulesApplyOnNextCycle) {
    fake_->set_transfers({named("a", "slow-a", 100 * KiB)});
    fake_->set_free_space(30 * GiB);
    auto service = start();
    
    service->trigger();
    ASSERT_TRUE(service->wait_idle(5s));
    EXPECT_TRUE(fake_->removed().empty());
    
    auto updated = settings_;
    updated.cleanup_tiers[1].free_space_gb = 40.0;
    std::string error;
    ASSERT_TRUE(provider_->replace(updated, error)) << error;
    
    service->trigger();
    ASSERT_TRUE(service->wait_idle(5s));
    ASSERT_EQ(fake_->removed().size(), 1u);
    EXPECT_EQ(store_->recent_actions(1)[0].reason.rfind("tier2", 0), 0u);
    EXPECT_EQ(*store_->latest_rule_snapshot(), CleanupRules::from_settings(updated).serialize());
}
