#include "config/ConfigManager.hpp"
#include "config/ConfigSections.hpp"
#include "detection/FormFieldDetector.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

using json = nlohmann::json;

namespace
{

void PrintUsage(const char* program_name)
{
    std::cout << "Usage: " << program_name << " [OPTIONS] [<text-file>|-]\n";
    std::cout << "formscan - form field detection for OCR text\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>      Read settings from a TOML file (default: formscan.toml)\n";
    std::cout << "  --account-info       Add the derived account attributes to the output\n";
    std::cout << "  --explain            Add the confidence breakdown of every field\n";
    std::cout << "  --verbose            Write detection traces to the log\n";
    std::cout << "  --version            Show version information\n";
    std::cout << "  --help               Show this help message\n";
    std::cout << "\nText is read from stdin when no file or '-' is given.\n";
}

void PrintVersion()
{
    std::cout << "formscan form field detector\n";
    std::cout << "Version: 1.0.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

bool ReadInput(const std::string& path, std::string& out)
{
    if (path.empty() || path == "-")
    {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        out = buffer.str();
        return !std::cin.bad();
    }

    std::ifstream file(path, std::ios::binary);
    if (!file)
        return false;
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

json FieldToJson(const detection::DetectedField& field)
{
    return json{ { "label", field.label },
                 { "value", field.value },
                 { "confidence", field.confidence },
                 { "line", field.line_number } };
}

json BreakdownToJson(const detection::ConfidenceBreakdown& b)
{
    return json{ { "vocabulary", b.vocabulary },   { "value", b.value }, { "labelShape", b.label_shape },
                 { "colon", b.colon },             { "total", b.total },
                 { "matchedPhrase", b.matched_phrase } };
}

void DrainErrors()
{
    const std::size_t dropped = utils::ErrorReporter::DroppedCount();
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
        std::cerr << utils::ErrorReporter::Format(report) << "\n";
    if (dropped > 0)
        std::cerr << "(" << dropped << " earlier reports not shown)\n";
}

int Run(int argc, char* argv[])
{
    std::string config_path = "formscan.toml";
    std::string input_path;
    bool opt_account_info = false;
    bool opt_explain = false;
    bool opt_verbose = false;

    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--version") == 0)
        {
            PrintVersion();
            return 0;
        }
        else if (std::strcmp(argv[i], "--help") == 0)
        {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (std::strcmp(argv[i], "--config") == 0)
        {
            if (i + 1 >= argc)
            {
                std::cerr << "ERROR: --config needs a file argument\n";
                return 2;
            }
            config_path = argv[++i];
        }
        else if (std::strcmp(argv[i], "--account-info") == 0)
        {
            opt_account_info = true;
        }
        else if (std::strcmp(argv[i], "--explain") == 0)
        {
            opt_explain = true;
        }
        else if (std::strcmp(argv[i], "--verbose") == 0)
        {
            opt_verbose = true;
        }
        else if (argv[i][0] == '-' && argv[i][1] != '\0')
        {
            std::cerr << "ERROR: unknown option " << argv[i] << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
        else if (input_path.empty())
        {
            input_path = argv[i];
        }
        else
        {
            std::cerr << "ERROR: only one input file is accepted\n";
            return 2;
        }
    }

    detection::DetectionConfig detection_cfg;
    utils::LogManager::Settings log_settings;

    ConfigManager config(config_path);
    if (!config_sections::registerSections(config, detection_cfg, log_settings))
        std::cerr << "WARNING: configuration sections could not be registered\n";
    // A parse error is reported through ErrorReporter and leaves the defaults in place.
    const bool config_ok = config.load();

    if (opt_verbose)
        log_settings.verbose = true;
    if (!utils::LogManager::Initialize(log_settings))
        std::cerr << "WARNING: logging could not be initialized\n";
    if (!config_ok)
        PLOG_WARNING << "Using default settings: " << config.lastError();

    std::string text;
    if (!ReadInput(input_path, text))
    {
        std::cerr << "ERROR: cannot read input '" << input_path << "'\n";
        DrainErrors();
        return 2;
    }

    detection::FormFieldDetector detector(detection_cfg);
    detection::DetectionResult result = detector.detectWithStats(text);

    json output;
    output["fields"] = json::array();
    for (const auto& field : result.fields)
    {
        json entry = FieldToJson(field);
        if (opt_explain)
            entry["breakdown"] = BreakdownToJson(detector.explain(field));
        output["fields"].push_back(std::move(entry));
    }

    if (opt_account_info)
    {
        output["accountInfo"] = json::object();
        for (const auto& [key, value] : detector.extractAccountInfo(result.fields))
            output["accountInfo"][key] = value;
    }

    output["stats"] = json{ { "linesProcessed", result.stats.lines_processed },
                            { "patternAttempts", result.stats.pattern_attempts },
                            { "patternFailures", result.stats.pattern_failures },
                            { "candidates", result.stats.candidates },
                            { "retained", result.stats.retained },
                            { "fields", result.stats.fields },
                            { "inputBytes", result.sanitize_report.input_bytes },
                            { "textTruncated", result.sanitize_report.text_truncated },
                            { "linesDropped", result.sanitize_report.lines_dropped },
                            { "linesShortened", result.sanitize_report.lines_shortened } };

    output["stats"]["stages"] = json::array();
    for (const auto& stage : result.stages)
    {
        output["stats"]["stages"].push_back(
            json{ { "name", stage.stage_name }, { "micros", stage.duration.count() }, { "ok", stage.ok } });
    }

    std::cout << output.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    DrainErrors();
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    try
    {
        return Run(argc, argv);
    }
    catch (const std::exception& ex)
    {
        PLOG_FATAL << "Unhandled exception: " << ex.what();
        std::cerr << "ERROR: " << ex.what() << "\n";
        return 1;
    }
}
