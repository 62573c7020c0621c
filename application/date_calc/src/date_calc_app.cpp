/**
 * @file date_calc_app.cpp
 * @brief 命令行日期计算前端实现
 */

#include "isocal/application/date_calc_app.h"

#include "isocal/common_utils/utilities/logging_utils.h"

#include <map>
#include <sstream>

namespace isocal::application {

using calendar::DateResolver;
using calendar::DateResolvers;
using calendar::LocalDate;
using common_utils::ConfigurationException;
using common_utils::ErrorCode;
using common_utils::IsocalBaseException;
using common_utils::LoggingConfig;
using common_utils::LoggingManager;

namespace {

const char* const kModule = "date_calc";

const std::map<std::string, DateOperation>& operationTable() {
    static const std::map<std::string, DateOperation> TABLE = {
        {"info", DateOperation::INFO},
        {"plus_days", DateOperation::PLUS_DAYS},
        {"minus_days", DateOperation::MINUS_DAYS},
        {"plus_weeks", DateOperation::PLUS_WEEKS},
        {"minus_weeks", DateOperation::MINUS_WEEKS},
        {"plus_months", DateOperation::PLUS_MONTHS},
        {"minus_months", DateOperation::MINUS_MONTHS},
        {"plus_years", DateOperation::PLUS_YEARS},
        {"minus_years", DateOperation::MINUS_YEARS},
        {"with_day_of_year", DateOperation::WITH_DAY_OF_YEAR},
        {"with_day_of_week", DateOperation::WITH_DAY_OF_WEEK}
    };
    return TABLE;
}

} // anonymous namespace

DateCalcApp::DateCalcApp(std::ostream& out) : out_(out), config_("isocal_date_calc") {
    config_.setDefault("config", "", "YAML configuration file");
    config_.setDefault("resolver", "previous_valid", "previous_valid | next_valid | strict");
    config_.setDefault("operation", "info", "Date operation to apply");
    config_.setDefault("amount", "0", "Operand of the date operation");
    config_.declareKey("year");
    config_.declareKey("month");
    config_.declareKey("day");
}

int DateCalcApp::run(int argc, const char* const argv[]) {
    try {
        loadConfiguration(argc, argv);
        configureLogging();

        LocalDate result = compute();
        out_ << formatResult(result) << std::endl;
        ISOCAL_LOG_DEBUG(kModule, "Computed {}", result.toString());
        return static_cast<int>(ExitStatus::SUCCESS);
    } catch (const IsocalBaseException& e) {
        ISOCAL_LOG_ERROR(kModule, "{}", e.what());
        return static_cast<int>(exitStatusFor(e));
    }
}

void DateCalcApp::loadConfiguration(int argc, const char* const argv[]) {
    // 先读命令行以获得 --config；低优先级来源随后加载也不会覆盖它
    config_.loadFromCommandLine(argc, argv);
    config_.loadFromEnvironment();

    std::string configPath = config_.getString("config");
    if (!configPath.empty() && !config_.loadFromFile(configPath)) {
        ISOCAL_THROW(ConfigurationException, "Unable to load configuration file: " << configPath);
    }

    auto missing = config_.validateRequired({"year", "month", "day"});
    if (!missing.empty()) {
        std::ostringstream oss;
        for (std::size_t i = 0; i < missing.size(); ++i) {
            oss << (i > 0 ? ", " : "") << missing[i];
        }
        ISOCAL_THROW(ConfigurationException, "Missing required settings: " << oss.str());
    }
}

void DateCalcApp::configureLogging() const {
    LoggingConfig loggingConfig;
    loggingConfig.console_level = config_.getString("log_level", "info");

    std::string logFile = config_.getString("log_file");
    if (!logFile.empty()) {
        loggingConfig.enable_file = true;
        loggingConfig.log_filename = logFile;
    }
    LoggingManager::configureGlobal(loggingConfig);
}

LocalDate DateCalcApp::compute() const {
    LocalDate date = LocalDate::date(config_.getInt64("year"), config_.getInt("month"), config_.getInt("day"));
    DateOperation operation = parseOperation(config_.getString("operation", "info"));
    DateResolver resolver = parseResolver(config_.getString("resolver", "previous_valid"));

    ISOCAL_LOG_DEBUG(kModule, "Input {} operation {} resolver {}",
                     date.toString(), config_.getString("operation"), resolver.getName());

    switch (operation) {
        case DateOperation::INFO:
            return date;
        case DateOperation::PLUS_DAYS:
            return date.plusDays(config_.getInt64("amount"));
        case DateOperation::MINUS_DAYS:
            return date.minusDays(config_.getInt64("amount"));
        case DateOperation::PLUS_WEEKS:
            return date.plusWeeks(config_.getInt("amount"));
        case DateOperation::MINUS_WEEKS:
            return date.minusWeeks(config_.getInt("amount"));
        case DateOperation::PLUS_MONTHS:
            return date.plusMonths(config_.getInt("amount"), resolver);
        case DateOperation::MINUS_MONTHS:
            return date.minusMonths(config_.getInt("amount"), resolver);
        case DateOperation::PLUS_YEARS:
            return date.plusYears(config_.getInt("amount"), resolver);
        case DateOperation::MINUS_YEARS:
            return date.minusYears(config_.getInt("amount"), resolver);
        case DateOperation::WITH_DAY_OF_YEAR:
            return date.withDayOfYear(config_.getInt("amount"));
        case DateOperation::WITH_DAY_OF_WEEK:
            return date.withDayOfWeek(config_.getInt("amount"));
    }
    ISOCAL_THROW(ConfigurationException, "Unhandled operation");
}

DateOperation DateCalcApp::parseOperation(const std::string& name) {
    auto it = operationTable().find(name);
    if (it == operationTable().end()) {
        ISOCAL_THROW(ConfigurationException, "Unknown operation: '" << name << "'");
    }
    return it->second;
}

DateResolver DateCalcApp::parseResolver(const std::string& name) {
    auto resolver = DateResolvers::forName(name);
    if (!resolver) {
        ISOCAL_THROW(ConfigurationException,
                     "Unknown resolver: '" << name << "' (expected previous_valid, next_valid or strict)");
    }
    return *resolver;
}

std::string DateCalcApp::formatResult(const LocalDate& date) {
    std::ostringstream oss;
    oss << date.toString() << ' ' << date.getDayOfWeek().getName()
        << " day-of-year=" << date.getDayOfYear().getValue();
    return oss.str();
}

ExitStatus DateCalcApp::exitStatusFor(const IsocalBaseException& e) {
    switch (e.getCode()) {
        case ErrorCode::CONFIGURATION:
            return ExitStatus::CONFIGURATION_ERROR;
        case ErrorCode::RANGE:
        case ErrorCode::INVALID_FIELD:
            return ExitStatus::FIELD_ERROR;
        case ErrorCode::ARITHMETIC_OVERFLOW:
        case ErrorCode::NULL_INPUT:
            return ExitStatus::ARITHMETIC_ERROR;
        case ErrorCode::NONE:
            break;
    }
    return ExitStatus::UNEXPECTED_ERROR;
}

} // namespace isocal::application
