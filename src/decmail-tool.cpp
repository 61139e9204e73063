// DECMAIL Tool
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// Command-line access to the DECMAIL key and claim functions.
// Supports:
// - Account addresses derived from a seed
// - Key derivation by path or tag
// - Routing ids of public key addresses
// - Decoding public key addresses
// - Signing and verifying name claims

#include <decmail/core/errors.h>
#include <decmail/core/hex.h>
#include <decmail/dec/routing_id.h>
#include <decmail/keys/hdkey.h>
#include <decmail/keys/network_rules.h>
#include <decmail/keys/public_key_service.h>
#include <decmail/mail/account.h>
#include <decmail/mail/email_address.h>
#include <decmail/names/name_claim.h>
#include <decmail/util/config.h>
#include <decmail/util/logging.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace decmail;

// ============================================================================
// Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";

// ============================================================================
// Options
// ============================================================================

struct Options {
    std::string command;
    std::vector<std::string> args;
    std::string seedHex;
    std::string tag;
    std::string path;
    std::string configFile;
    int32_t account{0};
    bool help{false};
    bool version{false};
};

/// Value of "-name=value" or "--name=value", empty when arg is another option
bool MatchOption(const std::string& arg, const std::string& name, std::string& value) {
    for (const std::string& prefix : {"-" + name + "=", "--" + name + "="}) {
        if (arg.rfind(prefix, 0) == 0) {
            value = arg.substr(prefix.size());
            return true;
        }
    }
    return false;
}

int32_t ParseAccountIndex(const std::string& value) {
    long long index = -1;
    size_t used = 0;
    try {
        index = std::stoll(value, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != value.size() || index < 0 || index >= HARDENED_FLAG) {
        throw InvalidArgumentError("Account index must be between 0 and " +
                                   std::to_string(HARDENED_FLAG - 1) + ": " + value);
    }
    return static_cast<int32_t>(index);
}

Options ParseArgs(int argc, char* argv[]) {
    Options opts;
    
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        std::string value;
        
        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-v" || arg == "--version") {
            opts.version = true;
        } else if (MatchOption(arg, "seed", value)) {
            opts.seedHex = value;
        } else if (MatchOption(arg, "tag", value)) {
            opts.tag = value;
        } else if (MatchOption(arg, "path", value)) {
            opts.path = value;
        } else if (MatchOption(arg, "conf", value)) {
            opts.configFile = value;
        } else if (MatchOption(arg, "account", value)) {
            opts.account = ParseAccountIndex(value);
        } else if (!arg.empty() && arg[0] != '-') {
            if (opts.command.empty()) {
                opts.command = arg;
            } else {
                opts.args.push_back(arg);
            }
        } else {
            throw InvalidArgumentError("Unknown option: " + arg);
        }
    }
    
    return opts;
}

void PrintUsage() {
    std::cout << "DECMAIL Tool v" << VERSION << "\n";
    std::cout << "\n";
    std::cout << "Usage: decmail-tool <command> [arguments] [options]\n";
    std::cout << "\n";
    std::cout << "Commands:\n";
    std::cout << "  address                     Eppie address of an account (or of -tag)\n";
    std::cout << "  derive                      Public key at -path or for -tag\n";
    std::cout << "  route <key>                 Routing id of a public key address\n";
    std::cout << "  decode <key>                Compressed hex of a public key address\n";
    std::cout << "  claim-sign <name>           Sign a name claim for an account\n";
    std::cout << "  claim-verify <name> <key> <signature>\n";
    std::cout << "                              Verify a name claim signature\n";
    std::cout << "  help                        Show this help message\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  -seed=<hex>      Seed of the master key (16 to 64 bytes)\n";
    std::cout << "  -account=<n>     Decentralized account index (default: 0)\n";
    std::cout << "  -tag=<text>      Derive by tag instead of account index\n";
    std::cout << "  -path=<path>     Derivation path, e.g. m/44'/3630'/0'/10/0\n";
    std::cout << "  -conf=<file>     Configuration file ([log] section)\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  decmail-tool address -seed=000102030405060708090a0b0c0d0e0f -account=1\n";
    std::cout << "  decmail-tool claim-sign alice -seed=000102030405060708090a0b0c0d0e0f\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << "DECMAIL Tool v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 DECMAIL Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Setup
// ============================================================================

/// Log to stderr at WARN unless the configuration says otherwise
void SetupLogging(const std::string& configFile) {
    auto& logger = util::Logger::Instance();
    logger.SetLevel(util::LogLevel::Warn);
    
    util::ConsoleSink::Config sinkConfig;
    sinkConfig.level = util::LogLevel::Warn;
    
    if (!configFile.empty()) {
        util::ConfigManager config;
        auto result = config.ParseFile(configFile);
        if (!result.success) {
            throw InvalidArgumentError("Config error: " + result.errorMessage +
                                       (result.errorLine > 0
                                            ? " (line " + std::to_string(result.errorLine) + ")"
                                            : std::string()));
        }
        bool hasLevel = config.HasKey(util::ConfigKeys::LOG_LEVEL, util::ConfigKeys::LOG_SECTION);
        util::ConsoleSink::Config configured = util::ApplyLogConfig(config);
        if (!hasLevel) {
            configured.level = util::LogLevel::Warn;
        }
        sinkConfig = configured;
    }
    
    sinkConfig.stderrOnly = true;
    logger.AddSink(std::make_shared<util::ConsoleSink>(sinkConfig));
}

MasterKey LoadMasterKey(const Options& opts) {
    if (opts.seedHex.empty()) {
        throw InvalidArgumentError("-seed=<hex> is required");
    }
    Bytes seed = HexToBytes(opts.seedHex);
    MasterKey master = MasterKey::FromSeed(seed);
    if (!master.IsValid()) {
        throw InvalidArgumentError("Seed must be between " + std::to_string(MIN_SEED_SIZE) +
                                   " and " + std::to_string(MAX_SEED_SIZE) + " bytes");
    }
    return master;
}

const std::string& RequireArg(const Options& opts, size_t index, const char* name) {
    if (opts.args.size() <= index) {
        throw InvalidArgumentError(std::string("Missing argument: ") + name);
    }
    return opts.args[index];
}

// ============================================================================
// Commands
// ============================================================================

int CommandAddress(const Options& opts, const PublicKeyService& keys) {
    MasterKey master = LoadMasterKey(opts);
    
    std::string key = opts.tag.empty()
        ? keys.DeriveEncoded(master, GetAccountKeyPath(NetworkType::Eppie,
                                                       static_cast<uint32_t>(opts.account)))
        : keys.DeriveEncoded(master, opts.tag);
    
    std::cout << EmailAddress::CreateDecentralizedAddress(NetworkType::Eppie, key).Address() << "\n";
    return 0;
}

int CommandDerive(const Options& opts, const PublicKeyService& keys) {
    MasterKey master = LoadMasterKey(opts);
    
    if (!opts.tag.empty()) {
        std::cout << keys.DeriveEncoded(master, opts.tag) << "\n";
        return 0;
    }
    
    DerivationPath path = GetAccountKeyPath(NetworkType::Eppie, static_cast<uint32_t>(opts.account));
    if (!opts.path.empty()) {
        auto parsed = DerivationPath::FromString(opts.path);
        if (!parsed) {
            throw InvalidArgumentError("Invalid derivation path: " + opts.path);
        }
        path = *parsed;
    }
    
    std::cout << path.ToString() << " " << keys.DeriveEncoded(master, path) << "\n";
    return 0;
}

int CommandRoute(const Options& opts) {
    dec::RoutingId route(RequireArg(opts, 0, "key"));
    std::cout << route.ToString() << "\n";
    return 0;
}

int CommandDecode(const Options& opts, const PublicKeyService& keys) {
    PublicKey key = keys.Decode(RequireArg(opts, 0, "key"));
    std::cout << BytesToHex(key.ToVector()) << "\n";
    return 0;
}

int CommandClaimSign(const Options& opts, std::shared_ptr<const PublicKeyService> keys) {
    const std::string& name = RequireArg(opts, 0, "name");
    names::NameClaimSigner signer(LoadMasterKey(opts), std::move(keys));
    
    Account account(EmailAddress("claim@eppie"), opts.account);
    std::cout << "name=" << names::CanonicalizeName(name) << "\n";
    std::cout << "publicKey=" << signer.ClaimPublicKey(account) << "\n";
    std::cout << "signature=" << signer.SignClaim(name, account) << "\n";
    return 0;
}

int CommandClaimVerify(const Options& opts) {
    bool valid = names::VerifyClaimV1Signature(RequireArg(opts, 0, "name"),
                                               RequireArg(opts, 1, "key"),
                                               RequireArg(opts, 2, "signature"));
    std::cout << (valid ? "valid" : "invalid") << "\n";
    return valid ? 0 : 1;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        auto opts = ParseArgs(argc, argv);
        
        if (opts.version) {
            PrintVersion();
            return 0;
        }
        
        if (opts.help || opts.command.empty()) {
            PrintUsage();
            return opts.help ? 0 : 1;
        }
        
        SetupLogging(opts.configFile);
        auto keys = PublicKeyService::CreateDefault(std::make_shared<NullNameResolver>());
        
        // Route to command
        if (opts.command == "address") {
            return CommandAddress(opts, *keys);
        } else if (opts.command == "derive") {
            return CommandDerive(opts, *keys);
        } else if (opts.command == "route") {
            return CommandRoute(opts);
        } else if (opts.command == "decode") {
            return CommandDecode(opts, *keys);
        } else if (opts.command == "claim-sign") {
            return CommandClaimSign(opts, keys);
        } else if (opts.command == "claim-verify") {
            return CommandClaimVerify(opts);
        } else if (opts.command == "help") {
            PrintUsage();
            return 0;
        } else {
            std::cerr << "Unknown command: " << opts.command << "\n";
            std::cerr << "Run 'decmail-tool help' for usage.\n";
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
