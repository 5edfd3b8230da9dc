#pragma once
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace app
{

// Random-access byte source read one chunk at a time at send time.
class ObjectSource
{
  public:
    virtual ~ObjectSource() = default;

    virtual std::uint64_t size() const = 0;
    virtual bool read(std::uint64_t offset, std::size_t len, std::vector<std::uint8_t> &out) = 0;
};

class MemorySource final : public ObjectSource
{
  public:
    explicit MemorySource(std::vector<std::uint8_t> bytes) : bytes_(std::move(bytes)) {}

    std::uint64_t size() const override { return bytes_.size(); }
    bool read(std::uint64_t offset, std::size_t len, std::vector<std::uint8_t> &out) override;

  private:
    std::vector<std::uint8_t> bytes_;
};

class FileSource final : public ObjectSource
{
  public:
    // nullptr if the file cannot be opened
    static std::unique_ptr<FileSource> open(const std::string &path);

    std::uint64_t size() const override { return size_; }
    bool read(std::uint64_t offset, std::size_t len, std::vector<std::uint8_t> &out) override;
    const std::string &path() const { return path_; }

  private:
    FileSource(std::string path, std::ifstream in, std::uint64_t size)
        : path_(std::move(path)), in_(std::move(in)), size_(size)
    {
    }

    std::string   path_;
    std::ifstream in_;
    std::uint64_t size_{0};
};

}  // namespace app
