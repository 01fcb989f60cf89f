#pragma once

#include "../storage/storage_service.hpp"
#include <memory>
#include <string>
#include <vector>

namespace chunkvault::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;
    
    static CommandResult ok(const std::string& msg = "") {
        return {true, msg, 0};
    }
    
    static CommandResult error(const std::string& msg, int code = 1) {
        return {false, msg, code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    
    // args[0] is the command name itself.
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

// Base for commands that work on the local store. The service is opened on
// first use from the global Config.
class StorageCommandHandler : public CommandHandler {
protected:
    storage::StorageResult open_service();
    
    storage::StorageService& service() { return *service_; }

private:
    std::unique_ptr<storage::StorageService> service_;
};

class PutCommandHandler : public StorageCommandHandler {
public:
    PutCommandHandler(std::string content_type, std::string owner);
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Store a file"; }
    std::string get_usage() const override { return "put <file> [--type <content type>] [--owner <owner>]"; }

private:
    std::string content_type_;
    std::string owner_;
};

class GetCommandHandler : public StorageCommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Restore a stored file"; }
    std::string get_usage() const override { return "get <file id> <output path>"; }
};

class RemoveCommandHandler : public StorageCommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Delete a stored file"; }
    std::string get_usage() const override { return "rm <file id>"; }
};

class ListCommandHandler : public StorageCommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List stored files, optionally filtered"; }
    std::string get_usage() const override { return "ls [query]"; }
};

class InfoCommandHandler : public StorageCommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show a file record and its chunks"; }
    std::string get_usage() const override { return "info <file id>"; }
};

class StatsCommandHandler : public StorageCommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show storage usage"; }
    std::string get_usage() const override { return "stats"; }
};

class GcCommandHandler : public StorageCommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Remove blobs no file refers to"; }
    std::string get_usage() const override { return "gc"; }
};

}
