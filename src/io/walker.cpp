// ==============================================================================
// walker.cpp - Параллельный обход дерева каталогов
// ==============================================================================
//
// Схема: общая очередь каталогов (mutex + condition_variable), N воркеров.
// Воркер читает каталог, подкаталоги кладёт обратно в очередь, файлы
// копит в локальном батче и сбрасывает в Collector.
// Обход завершается, когда очередь пуста и ни один воркер не занят.
//
// ==============================================================================

#include "fiq/walker.hpp"

#include "fiq/config.hpp"
#include "fiq/glob.hpp"

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <system_error>
#include <thread>

namespace fiq::io {

namespace {

// ----------------------------------------------------------------------------
// DirQueue - очередь каталогов с учётом активных воркеров
// ----------------------------------------------------------------------------

struct DirTask {
    std::filesystem::path dir;
};

class DirQueue {
public:
    void push(DirTask task) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(std::move(task));
        }
        cv_.notify_one();
    }

    /// Взять задачу. false = обход завершён.
    bool pop(DirTask& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || active_ == 0; });
        if (queue_.empty()) {
            return false;
        }
        out = std::move(queue_.front());
        queue_.pop_front();
        ++active_;
        return true;
    }

    /// Отметить завершение задачи, взятой через pop()
    void done() {
        bool finished = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
            finished = (active_ == 0 && queue_.empty());
        }
        if (finished) {
            cv_.notify_all();
        }
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<DirTask> queue_;
    std::size_t active_ = 0;
};

// ----------------------------------------------------------------------------
// WalkContext - общее состояние одного обхода
// ----------------------------------------------------------------------------

struct WalkContext {
    ScanMode::Kind kind = ScanMode::Kind::Full;
    bool recursive = true;
    std::optional<glob::GlobMatcher> matcher;
    DirQueue queue;
    Collector collector;
};

/// Построить запись для файла, прошедшего фильтр имени.
/// nullopt если stat не удался (файл исчез, нет доступа).
std::optional<FileRecord> make_record(const std::filesystem::path& path, ScanMode::Kind kind) {
    FileRecord record;
    record.path = path;

    if (kind == ScanMode::Kind::NamesOnly) {
        return record;
    }

    auto st = platform::stat_path(path);
    if (!st || !st->is_regular) {
        return std::nullopt;
    }
    record.size = st->size;
    record.modified = st->modified;

    if (kind == ScanMode::Kind::Full) {
        record.extension = lowercase_extension(path);
    }
    return record;
}

void flush_batch(WalkContext& ctx, std::vector<FileRecord>& batch) {
    if (batch.empty()) {
        return;
    }
    ctx.collector.append(std::move(batch));
    batch.clear();
    batch.reserve(COLLECTOR_BATCH_SIZE);
}

/// Прочитать один каталог
void process_directory(WalkContext& ctx, const DirTask& task, std::vector<FileRecord>& batch) {
    std::error_code ec;
    std::filesystem::directory_iterator it(
        task.dir, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        return;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return;
        }
        const auto& entry = *it;

        // Тип берётся из d_type без дополнительного stat, где это возможно
        std::error_code type_ec;
        auto type = entry.symlink_status(type_ec).type();
        if (type_ec) {
            continue;
        }

        if (type == std::filesystem::file_type::directory) {
            if (ctx.recursive) {
                ctx.queue.push(DirTask{entry.path()});
            }
            continue;
        }
        if (type != std::filesystem::file_type::regular) {
            // symlink, fifo, socket, устройства
            continue;
        }

        // Фильтр имени до любого stat
        if (ctx.matcher.has_value()) {
            std::string name = entry.path().filename().string();
            if (!ctx.matcher->is_match(name)) {
                continue;
            }
        }

        auto record = make_record(entry.path(), ctx.kind);
        if (!record) {
            continue;
        }
        batch.push_back(std::move(*record));
        if (batch.size() >= COLLECTOR_BATCH_SIZE) {
            flush_batch(ctx, batch);
        }
    }
}

void worker_loop(WalkContext& ctx) {
    std::vector<FileRecord> batch;
    batch.reserve(COLLECTOR_BATCH_SIZE);

    DirTask task;
    while (ctx.queue.pop(task)) {
        process_directory(ctx, task, batch);
        ctx.queue.done();
    }

    // Сброс остатка при завершении воркера
    flush_batch(ctx, batch);
}

}  // namespace

// ----------------------------------------------------------------------------
// Collector
// ----------------------------------------------------------------------------

void Collector::append(std::vector<FileRecord>&& batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.empty()) {
        records_ = std::move(batch);
        return;
    }
    records_.insert(records_.end(), std::make_move_iterator(batch.begin()),
                    std::make_move_iterator(batch.end()));
}

std::vector<FileRecord> Collector::take() {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::move(records_);
}

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

std::optional<std::string> lowercase_extension(const std::filesystem::path& p) {
    std::string ext = p.extension().string();
    if (ext.size() <= 1) {
        return std::nullopt;
    }
    ext.erase(0, 1);  // Убираем точку
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::size_t walker_threads(ScanMode::Kind kind) {
    auto settings = config::current();
    if (settings.threads.has_value()) {
        return *settings.threads;
    }
    if (kind == ScanMode::Kind::Full) {
        return DEFAULT_WALKER_THREADS;
    }
    // Лёгкая работа на файл: больше потоков только добавляет переключений
    return std::max<std::size_t>(2, platform::available_cores() / 2);
}

std::vector<FileRecord> walk(const std::filesystem::path& root, bool recursive,
                             const ScanMode& mode) {
    return walk(root, recursive, mode, walker_threads(mode.kind));
}

std::vector<FileRecord> walk(const std::filesystem::path& root, bool recursive,
                             const ScanMode& mode, std::size_t threads) {
    std::error_code ec;
    std::filesystem::path base = std::filesystem::absolute(root, ec);
    if (ec) {
        return {};
    }

    WalkContext ctx;
    ctx.kind = mode.kind;
    ctx.recursive = recursive;
    if (mode.pattern.has_value()) {
        ctx.matcher = glob::GlobMatcher::compile(*mode.pattern);
        if (!ctx.matcher.has_value()) {
            // Некорректный паттерн не совпадает ни с чем
            return {};
        }
    }

    auto root_stat = platform::stat_path(base);
    if (!root_stat) {
        return {};
    }

    // Корень - обычный файл: он сам и есть результат
    if (root_stat->is_regular) {
        if (ctx.matcher.has_value() && !ctx.matcher->is_match(base.filename().string())) {
            return {};
        }
        auto record = make_record(base, ctx.kind);
        if (!record) {
            return {};
        }
        std::vector<FileRecord> single;
        single.push_back(std::move(*record));
        return single;
    }
    if (!root_stat->is_directory) {
        return {};
    }

    ctx.queue.push(DirTask{base});

    std::size_t n = std::max<std::size_t>(1, threads);
    std::vector<std::thread> workers;
    workers.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        workers.emplace_back([&ctx] { worker_loop(ctx); });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    return ctx.collector.take();
}

}  // namespace fiq::io
