#pragma once

#include <optional>
#include <string>

#include <QString>
#include <QStringList>

#include "common/config.hpp"
#include "common/models.hpp"

namespace scorebook {

class ScorebookCli
{
public:
    // CLI dispatcher for single games, batches, and rule lookups.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    int runBuild(const QStringList &args);
    int runBatch(const QStringList &args);
    int runCheckPlay(const QStringList &args);

    // Defaults, config file, environment, then command-line flags.
    std::optional<PipelineConfig> resolveConfig(const QStringList &args) const;
};

// Short linescore, key play, and anomaly summary.
std::string renderGameMarkdown(const Game &game);

} // namespace scorebook
