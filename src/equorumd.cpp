// EQUORUM - Governance Host
// Copyright (c) 2024 EQUORUM Developers
// MIT License
//
// Loads configuration, opens the governance database, restores the engine
// state and prints a status summary.

#include "equorum/core/types.h"
#include "equorum/crypto/sha256.h"
#include "equorum/db/database.h"
#include "equorum/db/governancedb.h"
#include "equorum/governance/governor.h"
#include "equorum/governance/params.h"
#include "equorum/util/config.h"
#include "equorum/util/logging.h"
#include "equorum/util/time.h"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

using namespace equorum;

namespace {

constexpr const char* VERSION = "1.0.0";
constexpr const char* DEFAULT_DATADIR = "~/.equorum";
constexpr const char* DB_SUBDIR = "governance";

void PrintUsage() {
    std::cout << "EQUORUM Governance Host v" << VERSION << "\n\n";
    std::cout << "Usage: equorumd [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -version                   Show version information\n";
    std::cout << "  -conf=FILE                 Config file (default: <datadir>/"
              << util::DEFAULT_CONFIG_FILENAME << ")\n";
    std::cout << "  -datadir=DIR               Data directory (default: " << DEFAULT_DATADIR << ")\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error (default: info)\n";
    std::cout << "  -logfile=FILE              Also write the log to FILE\n";
    std::cout << "  -admin=ADDRESS             Initial timelock admin (default: the orchestrator)\n";
    std::cout << "\nGovernance Options ([governance] section, or -governance.KEY=VALUE):\n";
    std::cout << "  proposalthreshold=N        Voting power needed to propose\n";
    std::cout << "  minlockamount=N            Minimum lock in minor units\n";
    std::cout << "  minlockage=DURATION        Lock age required to propose or vote\n";
    std::cout << "  votingdelay=DURATION       Delay before voting opens\n";
    std::cout << "  votingperiod=DURATION      Length of the voting window\n";
    std::cout << "  quorumbps=N                Quorum as sqrt of this share (bps) of total locked\n";
    std::cout << "  timelockdelay=DURATION     Minimum timelock delay\n";
    std::cout << "  graceperiod=DURATION       Execution window after eta\n";
    std::cout << "  maxactions=N               Maximum actions per proposal\n";
    std::cout << "  excluded=ADDR,ADDR         Principals barred from governance\n";
    std::cout << "\n";
}

/// Well-known component address derived from a label
Address ComponentAddress(const std::string& label) {
    std::vector<Byte> bytes(label.begin(), label.end());
    Hash256 digest = SHA256Hash(bytes);
    return Address(digest.data(), Address::SIZE);
}

void SetupLogging(const util::ConfigManager& config) {
    auto& logger = util::Logger::Instance();
    logger.Initialize();
    logger.ClearSinks();

    logger.SetLevel(util::LogLevelFromString(config.GetString("loglevel", "info")));

    util::ConsoleSink::Config consoleConfig;
    consoleConfig.useStderr = true;
    logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));

    auto logFile = config.TryGetString("logfile");
    if (logFile) {
        auto fileSink = std::make_shared<util::FileSink>(util::ConfigManager::ExpandTilde(*logFile));
        if (fileSink->IsOpen()) {
            logger.AddSink(fileSink);
        } else {
            std::cerr << "Warning: cannot open log file " << *logFile << "\n";
        }
    }
}

bool LoadConfig(int argc, char* argv[], util::ConfigManager& config) {
    util::ConfigParseResult result = config.ParseCommandLine(argc, argv);
    if (!result.success) {
        std::cerr << "Error: " << result.ToString() << "\n";
        return false;
    }

    std::string datadir = util::ConfigManager::ExpandTilde(
        config.GetString("datadir", DEFAULT_DATADIR));
    std::string confPath = config.TryGetString("conf").value_or(
        (std::filesystem::path(datadir) / util::DEFAULT_CONFIG_FILENAME).string());
    confPath = util::ConfigManager::ExpandTilde(confPath);

    if (std::filesystem::exists(confPath)) {
        result = config.ParseFile(confPath);
        if (!result.success) {
            std::cerr << "Error: " << result.ToString() << "\n";
            return false;
        }
        // Command line wins over the file
        result = config.ParseCommandLine(argc, argv);
        if (!result.success) {
            std::cerr << "Error: " << result.ToString() << "\n";
            return false;
        }
    } else if (config.HasKey("conf")) {
        std::cerr << "Error: config file not found: " << confPath << "\n";
        return false;
    }

    config.Set("datadir", datadir);
    return true;
}

void PrintStatus(const governance::GovernanceOrchestrator& governor,
                 const governance::TimelockQueue& timelock) {
    std::cout << "Parameters: " << governor.GetParams().ToString() << "\n";
    std::cout << "Orchestrator: 0x" << governor.GetSelf().ToHex() << "\n";
    std::cout << "Timelock: 0x" << timelock.GetSelf().ToHex() << "\n";
    std::cout << "Timelock admin: 0x" << timelock.GetAdmin().ToHex() << "\n";

    Address pending = timelock.GetPendingAdmin();
    if (!pending.IsNull()) {
        std::cout << "Pending admin: 0x" << pending.ToHex() << "\n";
    }
    std::cout << "Queued timelock entries: " << timelock.GetQueuedCount() << "\n";
    std::cout << "Quorum: " << governor.GetQuorum() << "\n";

    uint64_t count = governor.GetProposalCount();
    std::cout << "Proposals: " << count << "\n";
    for (governance::ProposalId id = 1; id <= count; ++id) {
        auto proposal = governor.GetProposal(id);
        governance::ProposalState state;
        if (!proposal || !governor.GetState(id, &state).ok()) {
            continue;
        }
        std::cout << "  " << proposal->ToString() << " ["
                  << governance::ProposalStateToString(state) << "] "
                  << proposal->description << "\n";
    }
}

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    if (!LoadConfig(argc, argv, config)) {
        return 1;
    }
    if (config.GetBool("help", false)) {
        PrintUsage();
        return 0;
    }
    if (config.GetBool("version", false)) {
        std::cout << "EQUORUM Governance Host v" << VERSION << "\n";
        std::cout << "Copyright (c) 2024 EQUORUM Developers\n";
        std::cout << "MIT License\n";
        return 0;
    }

    SetupLogging(config);

    governance::GovernanceParams params;
    std::string error;
    if (!governance::GovernanceParams::FromConfig(config, params, &error)) {
        LOG_ERROR(util::LogCategory::CONFIG) << "Invalid governance configuration: " << error;
        return 1;
    }

    std::filesystem::path datadir = config.GetString("datadir", DEFAULT_DATADIR);
    std::error_code ec;
    std::filesystem::create_directories(datadir, ec);
    if (ec) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Cannot create data directory " << datadir
                                              << ": " << ec.message();
        return 1;
    }

    auto [status, database] = db::OpenDatabase(datadir / DB_SUBDIR);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Cannot open database: " << status.ToString();
        return 1;
    }
    db::GovernanceDB store(std::move(database));

    Address custody = ComponentAddress("equorum.custody");
    Address timelockAddr = ComponentAddress("equorum.timelock");
    Address governorAddr = ComponentAddress("equorum.governor");

    Address admin = governorAddr;
    if (auto adminHex = config.TryGetString("admin")) {
        try {
            admin = Address::FromHex(*adminHex);
        } catch (const std::invalid_argument& e) {
            LOG_ERROR(util::LogCategory::CONFIG) << "Invalid admin address: " << e.what();
            return 1;
        }
    }

    auto token = std::make_shared<governance::MemoryTokenLedger>();
    auto ledger = std::make_shared<governance::VotingPowerLedger>(custody, token, params);
    auto proposals = std::make_shared<governance::ProposalStore>(params, ledger);
    auto timelock = std::make_shared<governance::TimelockQueue>(timelockAddr, admin, params);
    governance::GovernanceOrchestrator governor(governorAddr, params, ledger, proposals, timelock);

    governance::GovernanceSnapshot snapshot;
    db::Status s = store.ReadSnapshot(&snapshot);
    if (s.ok()) {
        governor.Restore(snapshot);
    } else if (s.IsNotFound()) {
        LOG_INFO(util::LogCategory::DEFAULT) << "No stored state, initializing a new engine";
        s = store.WriteSnapshot(governor.Snapshot());
        if (!s.ok()) {
            LOG_ERROR(util::LogCategory::DB) << "Cannot write initial governance state: "
                                             << s.ToString();
            return 1;
        }
    } else {
        LOG_ERROR(util::LogCategory::DB) << "Cannot read governance state: " << s.ToString();
        return 1;
    }

    LOG_INFO(util::LogCategory::DEFAULT) << "EQUORUM v" << VERSION << " at "
                                         << util::FormatISO8601(util::GetTime());
    PrintStatus(governor, *timelock);

    util::Logger::Instance().Shutdown();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        return AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
