#pragma once

#include "persistence.hpp"
#include "types.hpp"

#include <deque>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace anybody::home::presence
{

/**
 * @class FileStore
 *
 * A key-value store kept as one cereal JSON file per key in a
 * directory:
 *
 *   roll_call    - the latest device to presence mapping
 *   anybody_home - if anybody was present at the latest roll call
 *   verdicts     - the last written verdict of every device
 *   history      - the most recent roll calls, oldest first
 *
 * Each file is replaced atomically by writing a temporary file next
 * to it and renaming it over the old one, so a reader never sees a
 * half written file.
 *
 * The history and verdicts are restored from the directory on
 * construction.  A file that can't be restored is removed, as are
 * restored verdicts of devices that are no longer configured.
 *
 * Writes are synchronous and run on the polling event loop, so the
 * directory must be on a local filesystem.  A network mount that
 * stops responding would stall polling.
 */
class FileStore : public PersistenceBase
{
  public:
    static constexpr auto rollCallKey = "roll_call";
    static constexpr auto anybodyHomeKey = "anybody_home";
    static constexpr auto verdictsKey = "verdicts";
    static constexpr auto historyKey = "history";

    FileStore() = delete;
    ~FileStore() override = default;
    FileStore(const FileStore&) = delete;
    FileStore& operator=(const FileStore&) = delete;
    FileStore(FileStore&&) = delete;
    FileStore& operator=(FileStore&&) = delete;

    /**
     * @brief Constructor
     *
     * Creates the directory if it doesn't exist yet.
     *
     * @param[in] root - The directory to keep the files in
     * @param[in] devices - The configured device names
     * @param[in] historySize - The number of roll calls to retain
     */
    FileStore(const std::filesystem::path& root,
              const std::vector<std::string>& devices, size_t historySize);

    void writeVerdict(const Verdict& verdict,
                      Clock::time_point timestamp) override;

    void writeRollCall(const RollCall& rollCall) override;

    std::string name() const override
    {
        return "file store " + _root.string();
    }

    const std::deque<RollCall>& history() const
    {
        return _history;
    }

    const std::map<std::string, Verdict>& verdicts() const
    {
        return _verdicts;
    }

    std::filesystem::path path(const std::string& key) const
    {
        return _root / key;
    }

  private:
    /**
     * @brief Serializes a value into the key's file.
     *
     * Throws std::runtime_error on failure, in which case the old
     * file is left intact.
     */
    template <typename T>
    void save(const std::string& key, const T& value) const;

    /**
     * @brief Restores a value from the key's file.
     *
     * @return false if there is no file or it couldn't be restored
     */
    template <typename T>
    bool restore(const std::string& key, T& value) const;

    void load();

    const std::filesystem::path _root;

    const std::set<std::string> _devices;

    const size_t _historySize;

    std::deque<RollCall> _history;

    std::map<std::string, Verdict> _verdicts;
};

} // namespace anybody::home::presence
