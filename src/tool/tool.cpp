// ECSIG - Signature Tool Implementation
// Copyright (c) 2024 ECSIG Developers
// MIT License
//
// Converts ECDSA signatures between the fixed-size r || s form and
// ASN.1 DER, normalizes them to low S, and reports size bounds.

#include "ecsig/tool/tool.h"

#include "ecsig/core/hex.h"
#include "ecsig/crypto/curve.h"
#include "ecsig/crypto/der.h"
#include "ecsig/crypto/signature.h"
#include "ecsig/crypto/sigerror.h"
#include "ecsig/util/config.h"
#include "ecsig/util/logging.h"

#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ecsig {
namespace tool {

namespace {

// ============================================================================
// Defaults
// ============================================================================

namespace defaults {
    constexpr const char* CURVE = "secp256k1";
    constexpr const char* LOGLEVEL = "warn";
    constexpr const char* INPUT = "fixed";
    constexpr const char* FORMAT = "hex";
}

/// Extra keys only the tool understands
constexpr const char* INPUT_KEY = "input";
constexpr const char* VERSION_KEY = "version";

// ============================================================================
// Tool Options
// ============================================================================

enum class SigForm { Fixed, Der };

struct ToolOptions {
    std::string curve{defaults::CURVE};
    SigForm input{SigForm::Fixed};
    bool rawOutput{false};
    bool normalize{false};

    std::string command;
    std::vector<std::string> args;
};

/// Sinks attached for one run, detached again when the run ends
class LogSession {
public:
    LogSession() : previousLevel_(util::Logger::Instance().GetLevel()) {}

    ~LogSession() {
        auto& logger = util::Logger::Instance();
        logger.Flush();
        for (const auto& sink : sinks_) {
            logger.RemoveSink(sink);
        }
        logger.SetLevel(previousLevel_);
    }

    LogSession(const LogSession&) = delete;
    LogSession& operator=(const LogSession&) = delete;

    void Attach(std::shared_ptr<util::ILogSink> sink) {
        util::Logger::Instance().AddSink(sink);
        sinks_.push_back(std::move(sink));
    }

private:
    util::LogLevel previousLevel_;
    std::vector<std::shared_ptr<util::ILogSink>> sinks_;
};

// ============================================================================
// Help Text
// ============================================================================

void PrintHelp(std::ostream& out) {
    out << TOOL_NAME << " v" << VERSION << "\n\n";
    out << "Usage: ecsig-tool [options] <command> [hex|-]\n\n";
    out << "Options:\n";
    out << "  -help                  Show this help message\n";
    out << "  -version               Show version information\n";
    out << "  -conf=FILE             Config file (default: ~/" << util::DEFAULT_CONFIG_FILENAME << ")\n";
    out << "  -curve=NAME            Curve (default: " << defaults::CURVE << ")\n";
    out << "  -input=fixed|der       Encoding of the input for normalize/inspect\n";
    out << "  -format=hex|raw        Write results as hex or raw bytes (default: hex)\n";
    out << "  -normalize             Normalize to low S before converting\n";
    out << "  -loglevel=LEVEL        trace, debug, info, warn, error, off (default: warn)\n";
    out << "  -logfile=FILE          Also append log output to FILE\n";
    out << "\nCommands:\n";
    out << "  fixed2der <hex>        Convert r || s to DER\n";
    out << "  der2fixed <hex>        Convert DER to r || s\n";
    out << "  normalize <hex>        Rewrite s as n - s when s > n / 2\n";
    out << "  inspect <hex>          Show components and encodings\n";
    out << "  maxsize                Show size bounds for the curve\n";
    out << "  curves                 List supported curves\n";
    out << "\nA hex argument of '-' or no argument reads one line from stdin.\n";
    out << "\nExit status: 0 success, 1 rejected signature, 2 usage error.\n";
    out << "\nExamples:\n";
    out << "  ecsig-tool fixed2der <128 hex chars>\n";
    out << "  ecsig-tool -curve=p256 -normalize fixed2der <hex>\n";
    out << "  ecsig-tool -input=der inspect 3006020101020101\n";
    out << "\n";
}

void PrintVersion(std::ostream& out) {
    out << TOOL_NAME << " v" << VERSION << "\n";
    out << "Copyright (c) 2024 ECSIG Developers\n";
    out << "MIT License\n";
}

// ============================================================================
// Configuration Loading
// ============================================================================

bool FileExists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

void ReportConfigError(std::ostream& err, const util::ConfigParseResult& result) {
    err << "Error: " << result.errorMessage;
    if (result.errorLine > 0) {
        err << " (" << result.errorFile << ":" << result.errorLine << ")";
    }
    err << "\n";
}

/// Build the configuration from defaults, config file and arguments.
/// Returns false on a config error, already reported.
bool LoadConfiguration(int argc, const char* const argv[], util::ConfigManager& config,
                       std::ostream& err) {
    using namespace util::ConfigKeys;

    for (const char* key : {CONF, CURVE, LOGLEVEL, LOGFILE, NORMALIZE, FORMAT, HELP,
                            INPUT_KEY, VERSION_KEY}) {
        config.AllowKey(key);
    }

    config.SetDefault(CURVE, defaults::CURVE);
    config.SetDefault(LOGLEVEL, defaults::LOGLEVEL);
    config.SetDefault(FORMAT, defaults::FORMAT);
    config.SetDefault(INPUT_KEY, defaults::INPUT);

    auto cmdResult = config.ParseCommandLine(argc, argv);
    if (!cmdResult.success) {
        ReportConfigError(err, cmdResult);
        return false;
    }

    // Files never override the command line
    std::string confPath;
    if (auto explicitConf = config.TryGetString(CONF)) {
        confPath = *explicitConf;
    } else {
        std::string userConfig =
            util::ConfigManager::ExpandTilde(std::string("~/") + util::DEFAULT_CONFIG_FILENAME);
        if (!FileExists(userConfig)) {
            return true;
        }
        confPath = userConfig;
    }

    auto fileResult = config.ParseFile(confPath, false);
    if (!fileResult.success) {
        ReportConfigError(err, fileResult);
        return false;
    }
    return true;
}

void SetupLogging(const util::ConfigManager& config, LogSession& session) {
    using namespace util;

    LogLevel level = LogLevelFromString(config.GetString(ConfigKeys::LOGLEVEL, defaults::LOGLEVEL));
    Logger::Instance().SetLevel(level);
    if (level == LogLevel::Off) {
        return;
    }

    ConsoleSink::Config consoleConfig;
    consoleConfig.showTimestamp = false;
    consoleConfig.level = level;
    session.Attach(std::make_shared<ConsoleSink>(consoleConfig));

    std::string logFile = config.GetPath(ConfigKeys::LOGFILE);
    if (!logFile.empty()) {
        auto fileSink = std::make_shared<FileSink>(logFile, level);
        if (fileSink->IsOpen()) {
            session.Attach(fileSink);
        } else {
            LOG_WARN(LogCategory::CLI) << "Cannot open log file " << logFile;
        }
    }
}

/// Translate the configuration into tool options.
/// Returns false on an invalid value, already reported.
bool ReadOptions(const util::ConfigManager& config, ToolOptions& options, std::ostream& err) {
    using namespace util::ConfigKeys;

    options.curve = config.GetString(CURVE, defaults::CURVE);
    options.normalize = config.GetBool(NORMALIZE, false);

    std::string format = config.GetString(FORMAT, defaults::FORMAT);
    if (format == "raw") {
        options.rawOutput = true;
    } else if (format != "hex") {
        err << "Error: unknown output format '" << format << "'\n";
        return false;
    }

    std::string input = config.GetString(INPUT_KEY, defaults::INPUT);
    if (input == "der") {
        options.input = SigForm::Der;
    } else if (input != "fixed") {
        err << "Error: unknown input encoding '" << input << "'\n";
        return false;
    }

    for (const auto& warning : config.Validate()) {
        LOG_WARN(util::LogCategory::CONFIG) << warning;
    }

    const auto& positional = config.GetPositionalArgs();
    if (!positional.empty()) {
        options.command = positional[0];
        options.args.assign(positional.begin() + 1, positional.end());
    }
    return true;
}

// ============================================================================
// Input and Output
// ============================================================================

/// Hex argument from the command line, or one line of input
std::string ReadHexArgument(const ToolOptions& options, std::istream& in) {
    if (!options.args.empty() && options.args[0] != "-") {
        return options.args[0];
    }
    std::string line;
    std::getline(in, line);
    return line;
}

void WriteBytes(const ToolOptions& options, std::ostream& out, Span<const Byte> bytes) {
    if (options.rawOutput) {
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
    } else {
        out << BytesToHex(bytes.data(), bytes.size()) << "\n";
    }
}

int ReportRejected(std::ostream& err, const char* what, SignatureError code) {
    LOG_DEBUG(util::LogCategory::CLI) << what << " rejected: " << SignatureErrorString(code);
    err << "Error: " << what << ": " << SignatureErrorString(code) << "\n";
    return EXIT_REJECTED;
}

/// Parse the input signature in the configured encoding
template<typename Curve>
std::optional<Signature<Curve>> ReadSignature(const std::vector<Byte>& bytes,
                                              SigForm form, SignatureError* error) {
    if (form == SigForm::Der) {
        return Signature<Curve>::FromDer(bytes, error);
    }
    return Signature<Curve>::FromBytes(bytes, error);
}

/// Apply -normalize; false if s is not a valid scalar
template<typename Curve>
bool MaybeNormalize(const ToolOptions& options, Signature<Curve>& sig, SignatureError* error) {
    if (!options.normalize) {
        return true;
    }
    auto changed = sig.NormalizeS(error);
    if (!changed) {
        return false;
    }
    LOG_INFO(util::LogCategory::SIG) << (*changed ? "Normalized high S" : "S already low");
    return true;
}

// ============================================================================
// Commands
// ============================================================================

template<typename Curve>
int CmdFixedToDer(const ToolOptions& options, ToolIo io, const std::vector<Byte>& input) {
    SignatureError code = SignatureError::OK;
    auto sig = Signature<Curve>::FromBytes(input, &code);
    if (!sig) {
        return ReportRejected(io.err, "fixed-size signature", code);
    }
    if (!MaybeNormalize(options, *sig, &code)) {
        return ReportRejected(io.err, "s component", code);
    }
    WriteBytes(options, io.out, sig->ToDer().AsBytes());
    return EXIT_OK;
}

template<typename Curve>
int CmdDerToFixed(const ToolOptions& options, ToolIo io, const std::vector<Byte>& input) {
    SignatureError code = SignatureError::OK;
    auto sig = Signature<Curve>::FromDer(input, &code);
    if (!sig) {
        return ReportRejected(io.err, "DER signature", code);
    }
    if (!MaybeNormalize(options, *sig, &code)) {
        return ReportRejected(io.err, "s component", code);
    }
    WriteBytes(options, io.out, sig->AsBytes());
    return EXIT_OK;
}

template<typename Curve>
int CmdNormalize(const ToolOptions& options, ToolIo io, const std::vector<Byte>& input) {
    SignatureError code = SignatureError::OK;
    auto sig = ReadSignature<Curve>(input, options.input, &code);
    if (!sig) {
        return ReportRejected(io.err, "signature", code);
    }

    auto changed = sig->NormalizeS(&code);
    if (!changed) {
        return ReportRejected(io.err, "s component", code);
    }
    LOG_INFO(util::LogCategory::SIG) << (*changed ? "Normalized high S" : "S already low");

    if (options.input == SigForm::Der) {
        WriteBytes(options, io.out, sig->ToDer().AsBytes());
    } else {
        WriteBytes(options, io.out, sig->AsBytes());
    }
    return EXIT_OK;
}

template<typename Curve>
int CmdInspect(const ToolOptions& options, ToolIo io, const std::vector<Byte>& input) {
    SignatureError code = SignatureError::OK;
    auto sig = ReadSignature<Curve>(input, options.input, &code);
    if (!sig) {
        return ReportRejected(io.err, "signature", code);
    }

    auto der = sig->ToDer();
    auto lowS = sig->IsLowS();

    io.out << "curve:      " << Curve::NAME << "\n";
    io.out << "r:          " << BytesToHex(sig->R().data(), sig->R().size()) << "\n";
    io.out << "s:          " << BytesToHex(sig->S().data(), sig->S().size()) << "\n";
    io.out << "low-s:      " << (lowS ? (*lowS ? "yes" : "no") : "invalid scalar") << "\n";
    io.out << "fixed:      " << sig->ToHex() << "\n";
    io.out << "der:        " << der.ToHex() << "\n";
    io.out << "der-size:   " << der.size() << " (max " << DerSignature<Curve>::MAX_SIZE << ")\n";
    return EXIT_OK;
}

template<typename Curve>
int CmdMaxSize(std::ostream& out) {
    out << "curve:         " << Curve::NAME << "\n";
    out << "element-size:  " << Curve::ELEMENT_SIZE << "\n";
    out << "fixed-size:    " << Signature<Curve>::SIZE << "\n";
    out << "der-max-size:  " << MaxDerSize(Curve::ELEMENT_SIZE) << "\n";
    out << "der-overhead:  " << MaxDerOverhead(Curve::ELEMENT_SIZE) << "\n";
    return EXIT_OK;
}

int CmdCurves(std::ostream& out) {
    for (const auto& name : SupportedCurveNames()) {
        out << name << "\n";
    }
    return EXIT_OK;
}

template<typename Curve>
int RunCommand(const ToolOptions& options, ToolIo io) {
    if (options.command == "maxsize") {
        return CmdMaxSize<Curve>(io.out);
    }

    std::vector<Byte> input;
    try {
        input = HexToBytes(ReadHexArgument(options, io.in));
    } catch (const std::invalid_argument& e) {
        io.err << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }
    LOG_DEBUG(util::LogCategory::CLI) << options.command << " on " << input.size()
                                      << " bytes for " << Curve::NAME;

    if (options.command == "fixed2der") {
        return CmdFixedToDer<Curve>(options, io, input);
    }
    if (options.command == "der2fixed") {
        return CmdDerToFixed<Curve>(options, io, input);
    }
    if (options.command == "normalize") {
        return CmdNormalize<Curve>(options, io, input);
    }
    return CmdInspect<Curve>(options, io, input);
}

bool IsKnownCommand(const std::string& command) {
    return command == "fixed2der" || command == "der2fixed" || command == "normalize" ||
           command == "inspect" || command == "maxsize" || command == "curves";
}

} // anonymous namespace

// ============================================================================
// Entry Point
// ============================================================================

int RunTool(int argc, const char* const argv[], ToolIo io) {
    util::ConfigManager config;
    if (!LoadConfiguration(argc, argv, config, io.err)) {
        return EXIT_USAGE;
    }

    if (config.GetBool(util::ConfigKeys::HELP, false)) {
        PrintHelp(io.out);
        return EXIT_OK;
    }
    if (config.GetBool(VERSION_KEY, false)) {
        PrintVersion(io.out);
        return EXIT_OK;
    }

    LogSession logSession;
    SetupLogging(config, logSession);

    ToolOptions options;
    if (!ReadOptions(config, options, io.err)) {
        return EXIT_USAGE;
    }

    if (options.command.empty()) {
        io.err << "Error: No command specified.\n";
        io.err << "Use 'ecsig-tool -help' for usage information.\n";
        return EXIT_USAGE;
    }
    if (!IsKnownCommand(options.command)) {
        io.err << "Error: unknown command '" << options.command << "'\n";
        return EXIT_USAGE;
    }
    if (options.command == "curves") {
        return CmdCurves(io.out);
    }

    int status = EXIT_USAGE;
    bool known = WithCurveByName(options.curve, [&](auto curve) {
        status = RunCommand<decltype(curve)>(options, io);
    });
    if (!known) {
        io.err << "Error: unknown curve '" << options.curve << "'\n";
        return EXIT_USAGE;
    }
    return status;
}

} // namespace tool
} // namespace ecsig
