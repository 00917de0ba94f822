#include "VaultCore.h"
#include <filesystem>
#include <string>

using namespace VaultEngine::Core;
using namespace VaultEngine::Core::IO;

static std::string tempPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

int main() {
    VirtualFileSystem vfs;
    const auto staging = tempPath("vault_move_staging.txt");
    const auto published = tempPath("vault_move_published.txt");

    // Write the new version next to the live file, then rename it over the live one
    auto live = vfs.openWritable(published);
    auto draft = vfs.openWritable(staging);
    if (!live || !draft) {
        VAULT_LOG_ERROR("Could not open handles");
        return 1;
    }

    auto w1 = live->write(std::string_view("version 1\n"));
    auto w2 = draft->write(std::string_view("version 2\n"));
    if (w1.status() != FileOpStatus::Complete || w2.status() != FileOpStatus::Complete) {
        const auto& failed = w1.succeeded() ? w2 : w1;
        VAULT_LOG_ERROR(std::string("Write failed: ") + failed.errorInfo().message);
        return 1;
    }

    auto m = draft->moveTo(*live);
    if (m.status() != FileOpStatus::Complete) {
        VAULT_LOG_ERROR(std::string("Move failed: ") + m.errorInfo().message);
        return 1;
    }
    VAULT_LOG_INFO(std::string("Moved; draft open: ") + (draft->isOpen() ? "yes" : "no") +
                   ", live open: " + (live->isOpen() ? "yes" : "no"));

    // Both identities are free again
    auto check = vfs.openWritable(published);
    auto dir = vfs.openWritable(std::filesystem::temp_directory_path().string());
    if (!check || !dir) return 1;
    auto refused = check->moveTo(*dir);
    VAULT_LOG_INFO(std::string("Move onto a directory: ") + toString(refused.errorInfo().code) +
                   ", handle still open: " + (check->isOpen() ? "yes" : "no"));

    auto c = dir->close();
    if (!c.succeeded()) {
        VAULT_LOG_ERROR(std::string("Close failed: ") + c.errorInfo().message);
        return 1;
    }
    auto rm = check->remove();
    if (!rm.succeeded()) {
        VAULT_LOG_ERROR(std::string("Remove failed: ") + rm.errorInfo().message);
        return 1;
    }
    return 0;
}
