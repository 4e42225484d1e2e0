#include "history.hpp"
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>
#include "lib.hpp"
#include "migration_sorter.hpp"

#define ER_MSG1 "migration number not found: %s"
#define ER_MSG2 "unable to parse migration number: %s"

MigrationHistory::MigrationHistory(std::vector<Migration> migrations)
    : migrations_(std::move(migrations)) {
    SortOptions opts;
    opts.allow_external = true;
    sort_migrations(migrations_, opts);
}

MigrationHistory MigrationHistory::of_group(const std::string& group) const {
    std::vector<Migration> own;
    for (const auto& m : migrations_) {
        if (m.group() == group) own.push_back(m);
    }
    return MigrationHistory(std::move(own));
}

const Migration* MigrationHistory::previous() const {
    if (migrations_.empty()) return nullptr;
    return &migrations_.back();
}

std::vector<ModelDescriptor> MigrationHistory::latest_models() const {
    std::map<std::string, const ModelDescriptor*> latest; // later migrations overwrite
    for (const auto& m : migrations_) {
        // a removed table leaves the snapshot until some migration embeds it again
        for (const auto& op : m.operations()) {
            if (op.kind == OpKind::RemoveModel) latest.erase(op.table_name);
        }
        for (const auto& model : m.models()) latest[model.table_name] = &model;
    }
    std::vector<ModelDescriptor> out;
    out.reserve(latest.size());
    for (const auto& kv : latest) out.push_back(*kv.second);
    return out;
}

unsigned int MigrationHistory::sequence_of(const std::string& migration_name) {
    ErrorContext ctx;
    ctx.migration = migration_name;

    // second '_'-separated segment
    auto first = migration_name.find('_');
    if (first == std::string::npos) {
        throw MigrationError(MigrationError::Kind::InvalidName, format_msg(ER_MSG1, migration_name.c_str()), ctx);
    }
    auto second = migration_name.find('_', first + 1);
    std::string segment = migration_name.substr(first + 1, second == std::string::npos ? std::string::npos : second - first - 1);

    if (segment.empty() || segment.find_first_not_of("0123456789") != std::string::npos) {
        throw MigrationError(MigrationError::Kind::InvalidName, format_msg(ER_MSG2, migration_name.c_str()), ctx);
    }
    try {
        unsigned long value = std::stoul(segment);
        if (value > 0xFFFFFFFFul) throw std::out_of_range(segment);
        return static_cast<unsigned int>(value);
    } catch (const std::out_of_range&) {
        throw MigrationError(MigrationError::Kind::InvalidName, format_msg(ER_MSG2, migration_name.c_str()), ctx);
    }
}

std::string MigrationHistory::next_migration_name(std::chrono::system_clock::time_point now) const {
    if (migrations_.empty()) return std::string(MIGRATION_PREFIX) + "0001_initial";

    unsigned int number = sequence_of(migrations_.back().name()) + 1;

    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream name;
    name << MIGRATION_PREFIX << std::setw(4) << std::setfill('0') << number
         << "_auto_" << std::put_time(&utc, "%Y%m%d_%H%M%S");
    return name.str();
}
