// ---------------------------------------------------------------------------
// file_pool.cpp
// ---------------------------------------------------------------------------

#include "workers/file_pool.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <thread>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

namespace asio = boost::asio;
namespace fs   = std::filesystem;

std::vector<fs::path> collect_sql_files(const std::vector<fs::path>& roots) {
    std::vector<fs::path> files;
    for (const auto& root : roots) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            spdlog::warn("file_pool: model path not found: {}", root.string());
            continue;
        }

        fs::recursive_directory_iterator it(
            root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            spdlog::warn("file_pool: cannot open {}: {}", root.string(), ec.message());
            continue;
        }
        for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                spdlog::warn("file_pool: traversal error under {}: {}", root.string(),
                             ec.message());
                break;
            }
            std::error_code type_ec;
            if (it->is_regular_file(type_ec) && it->path().extension() == ".sql") {
                files.push_back(it->path());
            }
        }
    }
    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());
    return files;
}

std::size_t resolve_worker_count(std::size_t requested) noexcept {
    if (requested > 0) {
        return requested;
    }
    return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

void parallel_for_each(const std::vector<fs::path>&                   files,
                       std::size_t                                    workers,
                       const std::function<void(const fs::path&)>&    fn) {
    if (files.empty()) {
        return;
    }
    const std::size_t threads = std::min(resolve_worker_count(workers), files.size());

    asio::thread_pool pool(threads);
    for (const auto& file : files) {
        asio::post(pool, [&fn, &file] {
            try {
                fn(file);
            } catch (const std::exception& ex) {
                spdlog::error("file_pool: {} failed: {}", file.string(), ex.what());
            }
        });
    }
    pool.join();
}
