#pragma once
#include "events.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

struct libevdev;
struct libevdev_uinput;
class CLogger;

struct SDeviceInfo {
    std::string path;
    std::string name;
};

// A physical evdev node, opened non-blocking and grabbed for as long as the object lives.
class CInputDevice {
  public:
    CInputDevice(const std::string& path, CLogger* logger = nullptr);
    ~CInputDevice();

    CInputDevice(const CInputDevice&)            = delete;
    CInputDevice& operator=(const CInputDevice&) = delete;

    enum eReadResult : uint8_t {
        READ_EVENT = 0,
        READ_AGAIN,   // nothing pending right now
        READ_DROPPED, // SYN_DROPPED, events since the last SYN_REPORT are incomplete
    };

    // Throws std::system_error on anything but "no data".
    eReadResult        readEvent(SRawEvent& out);

    int                fd() const;
    const std::string& path() const;
    const std::string& name() const;

  private:
    void        release();

    std::string m_path;
    std::string m_name;
    CLogger*    m_logger  = nullptr;
    int         m_fd      = -1;
    libevdev*   m_dev     = nullptr;
    bool        m_grabbed = false;
    bool        m_syncing = false;
};

// The synthetic mouse the filtered stream is written to. Unregistered on destruction.
class CVirtualDevice : public IEventSink {
  public:
    CVirtualDevice(const std::string& name, CLogger* logger = nullptr);
    virtual ~CVirtualDevice();

    CVirtualDevice(const CVirtualDevice&)            = delete;
    CVirtualDevice& operator=(const CVirtualDevice&) = delete;

    virtual void write(const SRawEvent& event);

    std::string  devnode() const;

  private:
    void             release();

    std::string      m_name;
    libevdev*        m_template = nullptr;
    libevdev_uinput* m_uinput   = nullptr;
};

bool                     isRoot();

// Every /dev/input/event* node with a left button, ordered by event number.
std::vector<SDeviceInfo> findMouseDevices(const std::string& dir = INPUT_DEVICE_DIR);
std::vector<SDeviceInfo> filterByName(const std::vector<SDeviceInfo>& devices, const std::string& filter);
void                     printDeviceList(const std::vector<SDeviceInfo>& devices, std::ostream& out);

// Resolves --device / device:path against the candidates. Without a spec, a single candidate is taken
// and several are listed on out with the choice read from in. Throws std::runtime_error on a bad choice.
SDeviceInfo selectDevice(const std::vector<SDeviceInfo>& devices, const std::optional<std::string>& spec, std::istream& in, std::ostream& out,
                         CLogger* logger = nullptr);
