// ==============================================================================
// discovery.cpp - Обход дерева файлов
// ==============================================================================

#include "filescanner/discovery.hpp"

#include "filescanner/platform.hpp"

#include <system_error>

namespace filescanner::io {

namespace {

void report(const WalkOptions& opt, const std::string& message) {
    if (opt.on_error) {
        opt.on_error(message);
    }
}

/// Обойти одну директорию.
/// @return false, если обход корня надо прекратить
bool walk_directory(const std::filesystem::path& dir, bool is_root, const WalkOptions& opt,
                    const FileVisitor& visit) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);

    if (ec) {
        if (is_root) {
            report(opt, "failed to read directory '" + platform::path_to_utf8(dir) + "' - " +
                            ec.message());
            return false;
        }
        // Поддиректория без доступа - пропускаем
        return true;
    }

    std::vector<std::filesystem::path> subdirs;

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (opt.check_interrupt) {
            platform::throw_if_interrupted();
        }

        const auto& entry = *it;
        std::error_code entry_ec;

        // Ссылки на директории не обходим
        auto link_status = entry.symlink_status(entry_ec);
        if (entry_ec) {
            continue;
        }
        if (std::filesystem::is_directory(link_status)) {
            subdirs.push_back(entry.path());
            continue;
        }

        auto status = entry.status(entry_ec);
        if (entry_ec) {
            continue;
        }
        if (std::filesystem::is_regular_file(status)) {
            visit(entry.path());
        }
    }

    // increment(ec) оставляет итератор в end при ошибке
    if (ec) {
        if (is_root) {
            report(opt, "failed to enumerate directory '" + platform::path_to_utf8(dir) + "' - " +
                            ec.message());
            return false;
        }
        return true;
    }

    for (const auto& sub : subdirs) {
        walk_directory(sub, false, opt, visit);
    }
    return true;
}

}  // namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

bool walk_files(const std::filesystem::path& root, const WalkOptions& opt,
                const FileVisitor& visit) {
    return walk_directory(root, true, opt, visit);
}

std::vector<std::filesystem::path> collect_files(const std::filesystem::path& root,
                                                 const WalkOptions& opt) {
    std::vector<std::filesystem::path> result;
    walk_files(root, opt, [&](const std::filesystem::path& p) { result.push_back(p); });
    return result;
}

}  // namespace filescanner::io
