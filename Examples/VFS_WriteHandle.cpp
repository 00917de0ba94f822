#include "VaultCore.h"
#include <chrono>
#include <filesystem>
#include <string>

using namespace VaultEngine::Core;
using namespace VaultEngine::Core::IO;

static std::string tempPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

int main() {
    VirtualFileSystem vfs;
    const auto path = tempPath("vault_write_handle.txt");

    auto handle = vfs.openWritable(path);
    if (!handle) {
        VAULT_LOG_ERROR("Could not open " + path);
        return 1;
    }

    auto w = handle->write(std::string_view("Hello, vault!\n"));
    if (w.status() != FileOpStatus::Complete) {
        VAULT_LOG_ERROR(std::string("Write failed: ") + w.errorInfo().message);
        handle->close();
        return 1;
    }
    VAULT_LOG_INFO("Wrote " + std::to_string(w.bytesWritten()) + " bytes, cursor at " + std::to_string(handle->position()));

    // Overwrite "vault" in place
    handle->position(7);
    auto patched = handle->write(std::string_view("VAULT"));

    // Seeking past the end leaves a zero-filled gap
    handle->position(32);
    auto tail = handle->write(std::string_view("tail\n"));
    if (!patched.succeeded() || !tail.succeeded()) {
        VAULT_LOG_ERROR(std::string("Write failed: ") + (patched.succeeded() ? tail : patched).errorInfo().message);
        handle->close();
        return 1;
    }

    auto touched = handle->setLastModified(std::chrono::system_clock::now() - std::chrono::hours(24));
    if (!touched.succeeded()) {
        VAULT_LOG_WARNING(std::string("Could not backdate: ") + touched.errorInfo().message);
    }

    auto c = handle->close();
    if (!c.succeeded()) {
        VAULT_LOG_ERROR(std::string("Close failed: ") + c.errorInfo().message);
        return 1;
    }

    // The handle is finished; further writes are rejected
    auto late = handle->write(std::string_view("too late"));
    VAULT_LOG_INFO(std::string("Write after close: ") + toString(late.errorInfo().code));

    auto meta = vfs.getMetadata(path);
    if (meta.succeeded() && meta.metadata()) {
        VAULT_LOG_INFO(path + " is " + std::to_string(meta.metadata()->size) + " bytes");
    }

    // Reopen to truncate and delete
    auto again = vfs.openWritable(path);
    if (!again) return 1;
    if (auto t = again->truncate(); !t.succeeded()) {
        VAULT_LOG_ERROR(std::string("Truncate failed: ") + t.errorInfo().message);
        again->close();
        return 1;
    }
    auto rm = again->remove();
    if (!rm.succeeded()) {
        VAULT_LOG_ERROR(std::string("Remove failed: ") + rm.errorInfo().message);
        return 1;
    }
    VAULT_LOG_INFO("Removed " + path);
    return 0;
}
