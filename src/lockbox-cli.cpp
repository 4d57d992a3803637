// LOCKBOX Command Line Interface
// Copyright (c) 2024 LOCKBOX Developers
// MIT License
//
// Drives a local ledger that runs the LockBox program.
// Supports:
// - Key generation and address display
// - Faucet airdrops
// - Initialize, deposit, withdraw, emergency withdraw and close
// - LockBox and balance inspection

#include <lockbox/crypto/keys.h>
#include <lockbox/db/database.h>
#include <lockbox/ledger/ledger.h>
#include <lockbox/program/errors.h>
#include <lockbox/program/instruction.h>
#include <lockbox/program/pda.h>
#include <lockbox/program/processor.h>
#include <lockbox/program/state.h>
#include <lockbox/util/config.h>
#include <lockbox/util/logging.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace lockbox;

// ============================================================================
// Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* KEYS_DIR = "keys";
constexpr const char* LEDGER_DIR = "ledger";
constexpr const char* KEY_EXTENSION = ".key";

// ============================================================================
// Helpers
// ============================================================================

/// Print horizontal line
void PrintLine(char c = '-', int width = 60) {
    std::cout << std::string(width, c) << "\n";
}

/// Parse a non-negative decimal lamport amount
std::optional<Lamports> ParseLamports(const std::string& str) {
    if (str.empty() || str.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return static_cast<Lamports>(std::stoull(str));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

/// Nonce for a fresh transaction
uint64_t NextNonce() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

// ============================================================================
// Session
// ============================================================================

/**
 * Everything a command needs: configuration, key storage and the ledger.
 */
class Session {
public:
    explicit Session(const util::ConfigManager& config) : config_(config) {}

    /// Read program and rent settings, open and load the ledger
    bool Open();

    fs::path KeyPath(const std::string& name) const {
        return fs::path(dataDir_) / KEYS_DIR / (name + KEY_EXTENSION);
    }

    bool SaveKey(const std::string& name, const PrivateKey& key) const;
    std::optional<PrivateKey> LoadKey(const std::string& name) const;

    const Address& ProgramId() const { return programId_; }
    ledger::Ledger& GetLedger() { return *ledger_; }

private:
    const util::ConfigManager& config_;
    std::string dataDir_;
    Address programId_;
    std::unique_ptr<ledger::Ledger> ledger_;
};

bool Session::Open() {
    dataDir_ = config_.GetDataDir();

    std::error_code ec;
    fs::create_directories(fs::path(dataDir_) / KEYS_DIR, ec);
    if (ec) {
        std::cerr << "Error: Cannot create data directory " << dataDir_ << ": "
                  << ec.message() << "\n";
        return false;
    }

    programId_ = DefaultProgramId();
    std::string programHex = config_.GetString(util::ConfigKeys::PROGRAMID, "");
    if (!programHex.empty()) {
        if (!IsHex(programHex) || programHex.size() != Address::SIZE * 2) {
            std::cerr << "Error: Invalid programid: " << programHex << "\n";
            return false;
        }
        programId_ = Address::FromHex(programHex);
    }

    ledger::RentParams rent;
    rent.lamportsPerByteYear = config_.GetUInt(util::ConfigKeys::RENT_LAMPORTS_PER_BYTE_YEAR,
                                               ledger::RentParams::DEFAULT_LAMPORTS_PER_BYTE_YEAR);
    rent.exemptionThreshold = config_.GetUInt(util::ConfigKeys::RENT_EXEMPTION_THRESHOLD,
                                              ledger::RentParams::DEFAULT_EXEMPTION_THRESHOLD);

    auto [status, database] = db::OpenDatabase(fs::path(dataDir_) / LEDGER_DIR);
    if (!status.ok()) {
        std::cerr << "Error: Cannot open ledger: " << status.ToString() << "\n";
        return false;
    }

    ledger_ = std::make_unique<ledger::Ledger>(LockBoxProgram(programId_), rent,
                                               std::shared_ptr<db::Database>(std::move(database)));

    status = ledger_->Load();
    if (!status.ok()) {
        std::cerr << "Error: Cannot load ledger: " << status.ToString() << "\n";
        return false;
    }

    LOG_DEBUG(util::LogCategory::CLI) << "Program " << programId_.ToHex()
                                      << ", data directory " << dataDir_;
    return true;
}

bool Session::SaveKey(const std::string& name, const PrivateKey& key) const {
    fs::path path = KeyPath(name);
    if (fs::exists(path)) {
        std::cerr << "Error: Key already exists: " << path.string() << "\n";
        return false;
    }

    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot write " << path.string() << "\n";
        return false;
    }
    file << key.ToHex() << "\n";
    file.close();

    std::error_code ec;
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
        LOG_WARN(util::LogCategory::CLI) << "Cannot restrict permissions on "
                                         << path.string() << ": " << ec.message();
    }
    return true;
}

std::optional<PrivateKey> Session::LoadKey(const std::string& name) const {
    fs::path path = KeyPath(name);
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Error: No key named '" << name << "' (" << path.string() << ")\n";
        return std::nullopt;
    }

    std::string hex;
    file >> hex;
    auto key = PrivateKey::FromHex(hex);
    if (!key) {
        std::cerr << "Error: Key file is corrupt: " << path.string() << "\n";
    }
    return key;
}

// ============================================================================
// Transaction Helpers
// ============================================================================

/// Sign, submit and report an instruction
int SubmitInstruction(Session& session, const PrivateKey& key,
                      const std::optional<Instruction>& ix) {
    if (!ix) {
        std::cerr << "Error: Cannot derive LockBox accounts\n";
        return 1;
    }

    auto tx = ledger::MakeTransaction(*ix, key, NextNonce());
    if (!tx) {
        std::cerr << "Error: Signing failed\n";
        return 1;
    }

    ledger::TransactionReceipt receipt = session.GetLedger().Submit(*tx);
    for (const auto& line : receipt.logs) {
        std::cout << "Program log: " << line << "\n";
    }

    if (!receipt.ok()) {
        std::cerr << "Error: " << FormatLockBoxError(receipt.status) << "\n";
        return 1;
    }

    std::cout << "Transaction " << receipt.messageHash.ToHex()
              << " confirmed at slot " << receipt.slot << "\n";
    return 0;
}

// ============================================================================
// Commands
// ============================================================================

int CommandKeygen(Session& session, const std::string& name) {
    PrivateKey key = PrivateKey::Generate();
    if (!session.SaveKey(name, key)) {
        return 1;
    }

    std::cout << "Created key '" << name << "'\n";
    std::cout << "Address: " << key.GetAddress().ToHex() << "\n";
    return 0;
}

int CommandAddress(Session& session, const std::string& name) {
    auto key = session.LoadKey(name);
    if (!key) {
        return 1;
    }

    std::cout << key->GetAddress().ToHex() << "\n";
    return 0;
}

int CommandAirdrop(Session& session, const std::string& name, Lamports amount) {
    auto key = session.LoadKey(name);
    if (!key) {
        return 1;
    }

    LockBoxError err = session.GetLedger().Airdrop(key->GetAddress(), amount);
    if (err != LockBoxError::OK) {
        std::cerr << "Error: " << FormatLockBoxError(err) << "\n";
        return 1;
    }

    std::cout << "Airdropped " << FormatLamports(amount) << " to '" << name << "'\n";
    std::cout << "Balance: " << FormatLamports(session.GetLedger().GetBalance(key->GetAddress()))
              << "\n";
    return 0;
}

int CommandInit(Session& session, const std::string& name, Lamports target) {
    auto key = session.LoadKey(name);
    if (!key) {
        return 1;
    }
    return SubmitInstruction(session, *key,
                             MakeInitialize(key->GetAddress(), target, session.ProgramId()));
}

int CommandDeposit(Session& session, const std::string& name, Lamports amount) {
    auto key = session.LoadKey(name);
    if (!key) {
        return 1;
    }
    return SubmitInstruction(session, *key,
                             MakeDeposit(key->GetAddress(), amount, session.ProgramId()));
}

int CommandWithdraw(Session& session, const std::string& name, Lamports amount) {
    auto key = session.LoadKey(name);
    if (!key) {
        return 1;
    }
    return SubmitInstruction(session, *key,
                             MakeWithdraw(key->GetAddress(), amount, session.ProgramId()));
}

int CommandEmergency(Session& session, const std::string& name) {
    auto key = session.LoadKey(name);
    if (!key) {
        return 1;
    }
    return SubmitInstruction(session, *key,
                             MakeEmergencyWithdraw(key->GetAddress(), session.ProgramId()));
}

int CommandClose(Session& session, const std::string& name) {
    auto key = session.LoadKey(name);
    if (!key) {
        return 1;
    }
    return SubmitInstruction(session, *key, MakeClose(key->GetAddress(), session.ProgramId()));
}

int CommandShow(Session& session, const std::string& name) {
    auto key = session.LoadKey(name);
    if (!key) {
        return 1;
    }

    auto accounts = DeriveAccounts(key->GetAddress(), session.ProgramId());
    if (!accounts) {
        std::cerr << "Error: Cannot derive LockBox accounts\n";
        return 1;
    }

    auto lockbox = session.GetLedger().GetLockBox(accounts->lockbox);
    if (!lockbox) {
        std::cerr << "Error: No LockBox for '" << name << "'\n";
        return 1;
    }

    Lamports vaultBalance = session.GetLedger().GetBalance(accounts->vault);

    std::cout << "\n";
    PrintLine('=');
    std::cout << "LockBox " << accounts->lockbox.ToHex() << "\n";
    PrintLine('=');
    std::cout << "Owner:          " << lockbox->owner.ToHex() << "\n";
    std::cout << "Vault:          " << accounts->vault.ToHex() << "\n";
    std::cout << "Status:         " << (lockbox->active ? "active" : "inactive") << "\n";
    std::cout << "Target:         " << FormatLamports(lockbox->targetAmount) << "\n";
    std::cout << "Deposited:      " << FormatLamports(lockbox->depositedAmount) << "\n";
    std::cout << "Withdrawn:      " << FormatLamports(lockbox->withdrawnAmount) << "\n";
    std::cout << "Vault balance:  " << FormatLamports(vaultBalance) << "\n";
    std::cout << "Remaining:      " << FormatLamports(lockbox->RemainingToTarget()) << "\n";
    std::cout << "Target reached: " << (lockbox->IsTargetReached() ? "yes" : "no") << "\n";
    std::cout << "Created at:     " << lockbox->createdAt << "\n";
    PrintLine('=');
    return 0;
}

int CommandBalance(Session& session, const std::string& name) {
    auto key = session.LoadKey(name);
    if (!key) {
        return 1;
    }

    Lamports balance = session.GetLedger().GetBalance(key->GetAddress());
    std::cout << balance << " lamports (" << FormatLamports(balance) << ")\n";
    return 0;
}

// ============================================================================
// Usage
// ============================================================================

void PrintUsage() {
    std::cout << "LOCKBOX CLI v" << VERSION << "\n\n";
    std::cout << "Usage: lockbox-cli [options] <command> [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  keygen <name>              Create a new key\n";
    std::cout << "  address <name>             Show the address of a key\n";
    std::cout << "  airdrop <name> <lamports>  Credit lamports from the faucet\n";
    std::cout << "  init <name> <target>       Create a LockBox with a savings target\n";
    std::cout << "  deposit <name> <amount>    Deposit into the vault\n";
    std::cout << "  withdraw <name> <amount>   Withdraw once the target is reached\n";
    std::cout << "  emergency <name>           Drain the vault and deactivate\n";
    std::cout << "  close <name>               Close an empty LockBox\n";
    std::cout << "  show <name>                Show LockBox state\n";
    std::cout << "  balance <name>             Show account balance\n";
    std::cout << "  help                       Show this help\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -datadir=<dir>             Data directory (default: ~/.lockbox)\n";
    std::cout << "  -conf=<file>               Config file (default: <datadir>/lockbox.conf)\n";
    std::cout << "  -loglevel=<level>          trace, debug, info, warn, error, off\n";
    std::cout << "  -logfile=<file>            Also log to a file\n";
    std::cout << "  -printtoconsole            Log to the console\n";
    std::cout << "  -programid=<hex>           Program id (default: built-in)\n";
    std::cout << "  -version                   Print version\n";
}

/// Expected positional argument count after the command name
int ExpectedArgs(const std::string& command) {
    if (command == "airdrop" || command == "init" ||
        command == "deposit" || command == "withdraw") {
        return 2;
    }
    if (command == "keygen" || command == "address" || command == "emergency" ||
        command == "close" || command == "show" || command == "balance") {
        return 1;
    }
    return -1;
}

// ============================================================================
// Logging Setup
// ============================================================================

bool SetupLogging(const util::ConfigManager& config) {
    util::LogLevel level = util::LogLevel::Warn;
    std::string levelName = config.GetString(util::ConfigKeys::LOGLEVEL, "warn");
    if (!util::ParseLogLevel(levelName, level)) {
        std::cerr << "Error: Invalid loglevel: " << levelName << "\n";
        return false;
    }

    auto& logger = util::Logger::Instance();
    logger.ClearSinks();
    logger.SetLevel(level);

    if (config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, false)) {
        logger.AddSink(std::make_shared<util::ConsoleSink>(level));
    }

    std::string logFile = config.GetPath(util::ConfigKeys::LOGFILE);
    if (!logFile.empty()) {
        auto sink = std::make_shared<util::FileSink>(logFile, level);
        if (!sink->IsOpen()) {
            std::cerr << "Error: Cannot open log file " << logFile << "\n";
            return false;
        }
        logger.AddSink(sink);
    }
    return true;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    util::ConfigManager config;
    for (const char* key : {util::ConfigKeys::DATADIR, util::ConfigKeys::CONF,
                            util::ConfigKeys::LOGLEVEL, util::ConfigKeys::LOGFILE,
                            util::ConfigKeys::PRINTTOCONSOLE, util::ConfigKeys::PROGRAMID,
                            util::ConfigKeys::RENT_LAMPORTS_PER_BYTE_YEAR,
                            util::ConfigKeys::RENT_EXEMPTION_THRESHOLD}) {
        config.AllowKey(key);
    }
    config.AllowKey("version");
    config.AllowKey("help");

    std::vector<std::string> args;
    auto result = config.ParseCommandLine(argc, argv, &args);
    if (!result.success) {
        std::cerr << "Error: " << result.ToString() << "\n";
        return 1;
    }

    if (config.GetBool("version", false)) {
        std::cout << "lockbox-cli v" << VERSION << "\n";
        return 0;
    }
    if (config.GetBool("help", false) || args.empty() || args[0] == "help") {
        PrintUsage();
        return args.empty() && !config.GetBool("help", false) ? 1 : 0;
    }

    result = config.LoadConfigFile();
    if (!result.success) {
        std::cerr << "Error: " << result.ToString() << "\n";
        return 1;
    }
    for (const auto& warning : result.warnings) {
        std::cerr << "Warning: " << warning << "\n";
    }
    for (const auto& key : config.UnknownKeys()) {
        std::cerr << "Warning: Unknown option: " << key << "\n";
    }

    if (!SetupLogging(config)) {
        return 1;
    }

    const std::string& command = args[0];
    int expected = ExpectedArgs(command);
    if (expected < 0) {
        std::cerr << "Unknown command: " << command << "\n";
        std::cerr << "Run 'lockbox-cli help' for usage.\n";
        return 1;
    }
    if (static_cast<int>(args.size()) - 1 != expected) {
        std::cerr << "Error: '" << command << "' takes " << expected << " argument(s)\n";
        return 1;
    }

    const std::string& name = args[1];
    std::optional<Lamports> amount;
    if (expected == 2) {
        amount = ParseLamports(args[2]);
        if (!amount) {
            std::cerr << "Error: Invalid amount: " << args[2] << "\n";
            return 1;
        }
    }

    Session session(config);
    if (!session.Open()) {
        return 1;
    }

    int rc = 1;
    if (command == "keygen") {
        rc = CommandKeygen(session, name);
    } else if (command == "address") {
        rc = CommandAddress(session, name);
    } else if (command == "airdrop") {
        rc = CommandAirdrop(session, name, *amount);
    } else if (command == "init") {
        rc = CommandInit(session, name, *amount);
    } else if (command == "deposit") {
        rc = CommandDeposit(session, name, *amount);
    } else if (command == "withdraw") {
        rc = CommandWithdraw(session, name, *amount);
    } else if (command == "emergency") {
        rc = CommandEmergency(session, name);
    } else if (command == "close") {
        rc = CommandClose(session, name);
    } else if (command == "show") {
        rc = CommandShow(session, name);
    } else if (command == "balance") {
        rc = CommandBalance(session, name);
    }

    util::Logger::Instance().Flush();
    return rc;
}
