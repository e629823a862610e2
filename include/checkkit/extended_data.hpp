#pragma once

#include <string>
#include <vector>

namespace checkkit {

// Receives one formatted line per record. Lets any logging facility
// feed the extended output without the core knowing about it.
class LineSink {
public:
    virtual ~LineSink() = default;
    virtual void ingest(const std::string& line) = 0;
};

// Long output printed after the summary line
class ExtendedData : public LineSink {
public:
    void add(const std::string& line);
    void ingest(const std::string& line) override { add(line); }

    // Lines joined with '\n', "" when nothing was added
    std::string render() const;

    const std::vector<std::string>& lines() const { return lines_; }
    bool empty() const { return lines_.empty(); }

private:
    std::vector<std::string> lines_;
};

} // namespace checkkit
