#include "device.hpp"
#include "log.hpp"
#include <libevdev/libevdev.h>
#include <libevdev/libevdev-uinput.h>
#include <algorithm>
#include <cerrno>
#include <cctype>
#include <filesystem>
#include <istream>
#include <iterator>
#include <ostream>
#include <stdexcept>
#include <system_error>
#include <fcntl.h>
#include <unistd.h>

static const unsigned int VIRTUAL_BUTTONS[] = {BTN_LEFT, BTN_RIGHT, BTN_MIDDLE, BTN_SIDE, BTN_EXTRA, BTN_FORWARD, BTN_BACK, BTN_TASK};
static const unsigned int VIRTUAL_AXES[]    = {REL_X, REL_Y, REL_WHEEL, REL_WHEEL_HI_RES, REL_HWHEEL, REL_HWHEEL_HI_RES};

static std::string trim(const std::string& str) {
    const auto begin = str.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return "";
    const auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(begin, end - begin + 1);
}

static bool parseIndex(const std::string& str, size_t& out) {
    if (str.empty() || str.size() > 9)
        return false;

    for (auto c : str) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    }

    out = std::stoul(str);
    return true;
}

// event12 -> 12, anything unexpected sorts first
static size_t eventNumber(const std::string& path) {
    const auto base  = std::filesystem::path(path).filename().string();
    size_t     index = 0;
    if (base.size() <= 5 || !parseIndex(base.substr(5), index))
        return 0;
    return index;
}

CInputDevice::CInputDevice(const std::string& path, CLogger* logger) : m_path(path), m_logger(logger) {
    m_fd = open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (m_fd < 0)
        throw std::system_error(errno, std::generic_category(), "cannot open " + path);

    try {
        int rc = libevdev_new_from_fd(m_fd, &m_dev);
        if (rc < 0)
            throw std::system_error(-rc, std::generic_category(), "libevdev init failed on " + path);

        const char* name = libevdev_get_name(m_dev);
        m_name           = name ? name : "Unknown Mouse";

        // nobody else sees the raw stream while we hold it
        rc = libevdev_grab(m_dev, LIBEVDEV_GRAB);
        if (rc < 0)
            throw std::system_error(-rc, std::generic_category(), "cannot grab " + path);
        m_grabbed = true;
    } catch (...) {
        release();
        throw;
    }

    if (m_logger)
        m_logger->info("intercepting device: " + m_name + " (" + m_path + ")");
}

CInputDevice::~CInputDevice() {
    release();
}

void CInputDevice::release() {
    if (m_dev && m_grabbed)
        libevdev_grab(m_dev, LIBEVDEV_UNGRAB);
    m_grabbed = false;

    if (m_dev)
        libevdev_free(m_dev);
    m_dev = nullptr;

    if (m_fd >= 0)
        close(m_fd);
    m_fd = -1;
}

CInputDevice::eReadResult CInputDevice::readEvent(SRawEvent& out) {
    input_event ev{};

    while (true) {
        const int rc = libevdev_next_event(m_dev, m_syncing ? LIBEVDEV_READ_FLAG_SYNC : LIBEVDEV_READ_FLAG_NORMAL, &ev);

        if (rc == -EAGAIN) {
            if (m_syncing) {
                m_syncing = false;
                if (m_logger)
                    m_logger->debug("resync finished on " + m_path);
                continue;
            }
            return READ_AGAIN;
        }

        if (rc < 0)
            throw std::system_error(-rc, std::generic_category(), "read failed on " + m_path);

        // SYN_DROPPED: the kernel buffer overflowed, replay the state delta libevdev computed
        if (rc == LIBEVDEV_READ_STATUS_SYNC && !m_syncing) {
            m_syncing = true;
            if (m_logger)
                m_logger->warn("events dropped by the kernel on " + m_path + ", resyncing");
            return READ_DROPPED;
        }

        out.type    = ev.type;
        out.code    = ev.code;
        out.value   = ev.value;
        out.arrival = std::chrono::steady_clock::now();
        return READ_EVENT;
    }
}

int CInputDevice::fd() const {
    return m_fd;
}

const std::string& CInputDevice::path() const {
    return m_path;
}

const std::string& CInputDevice::name() const {
    return m_name;
}

CVirtualDevice::CVirtualDevice(const std::string& name, CLogger* logger) : m_name(name) {
    m_template = libevdev_new();
    if (!m_template)
        throw std::runtime_error("libevdev_new failed");

    try {
        libevdev_set_name(m_template, m_name.c_str());

        for (auto code : VIRTUAL_BUTTONS) {
            if (libevdev_enable_event_code(m_template, EV_KEY, code, nullptr) < 0)
                throw std::runtime_error("cannot enable key " + std::to_string(code) + " on the virtual device");
        }

        for (auto code : VIRTUAL_AXES) {
            if (libevdev_enable_event_code(m_template, EV_REL, code, nullptr) < 0)
                throw std::runtime_error("cannot enable axis " + std::to_string(code) + " on the virtual device");
        }

        if (libevdev_enable_event_code(m_template, EV_MSC, MSC_SCAN, nullptr) < 0)
            throw std::runtime_error("cannot enable MSC_SCAN on the virtual device");

        const int rc = libevdev_uinput_create_from_device(m_template, LIBEVDEV_UINPUT_OPEN_MANAGED, &m_uinput);
        if (rc < 0)
            throw std::system_error(-rc, std::generic_category(), "cannot create uinput device " + m_name);
    } catch (...) {
        release();
        throw;
    }

    if (logger)
        logger->info("created virtual device: " + m_name + " (" + devnode() + ")");
}

CVirtualDevice::~CVirtualDevice() {
    release();
}

void CVirtualDevice::release() {
    if (m_uinput)
        libevdev_uinput_destroy(m_uinput);
    m_uinput = nullptr;

    if (m_template)
        libevdev_free(m_template);
    m_template = nullptr;
}

void CVirtualDevice::write(const SRawEvent& event) {
    const int rc = libevdev_uinput_write_event(m_uinput, event.type, event.code, event.value);
    if (rc < 0)
        throw std::system_error(-rc, std::generic_category(), "write failed on " + m_name);
}

std::string CVirtualDevice::devnode() const {
    const char* node = m_uinput ? libevdev_uinput_get_devnode(m_uinput) : nullptr;
    return node ? node : "?";
}

bool isRoot() {
    return geteuid() == 0;
}

std::vector<SDeviceInfo> findMouseDevices(const std::string& dir) {
    std::vector<SDeviceInfo> devices;

    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        const auto base = entry.path().filename().string();
        if (base.rfind("event", 0) != 0)
            continue;

        const auto path = entry.path().string();
        const int  fd   = open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0)
            continue;

        libevdev* dev = nullptr;
        if (libevdev_new_from_fd(fd, &dev) == 0 && dev) {
            if (libevdev_has_event_code(dev, EV_KEY, BTN_LEFT)) {
                const char* name = libevdev_get_name(dev);
                devices.push_back({path, name ? name : "Unknown Mouse"});
            }
            libevdev_free(dev);
        }
        close(fd);
    }

    std::sort(devices.begin(), devices.end(), [](const SDeviceInfo& a, const SDeviceInfo& b) { return eventNumber(a.path) < eventNumber(b.path); });

    return devices;
}

std::vector<SDeviceInfo> filterByName(const std::vector<SDeviceInfo>& devices, const std::string& filter) {
    std::vector<SDeviceInfo> out;
    std::copy_if(devices.begin(), devices.end(), std::back_inserter(out), [&](const SDeviceInfo& d) { return d.name.find(filter) != std::string::npos; });
    return out;
}

void printDeviceList(const std::vector<SDeviceInfo>& devices, std::ostream& out) {
    for (size_t i = 0; i < devices.size(); ++i) {
        out << i + 1 << ". " << devices[i].name << " (" << devices[i].path << ")\n";
    }
}

SDeviceInfo selectDevice(const std::vector<SDeviceInfo>& devices, const std::optional<std::string>& spec, std::istream& in, std::ostream& out, CLogger* logger) {
    if (spec) {
        size_t index = 0;
        if (parseIndex(*spec, index)) {
            if (index == 0 || index > devices.size())
                throw std::runtime_error("invalid device index " + *spec);
            return devices[index - 1];
        }

        if (spec->rfind("/dev/input/", 0) == 0) {
            const auto it = std::find_if(devices.begin(), devices.end(), [&](const SDeviceInfo& d) { return d.path == *spec; });
            if (it == devices.end())
                throw std::runtime_error("device " + *spec + " is not a usable mouse");
            return *it;
        }

        throw std::runtime_error("invalid device spec '" + *spec + "'");
    }

    if (devices.empty())
        throw std::runtime_error("no mouse devices found");

    if (devices.size() == 1) {
        if (logger)
            logger->info("using the only mouse: " + devices[0].name + " (" + devices[0].path + ")");
        return devices[0];
    }

    out << "Mouse devices:\n";
    printDeviceList(devices, out);
    out << "Device number: " << std::flush;

    std::string line;
    std::getline(in, line);
    line = trim(line);

    size_t index = 0;
    if (!parseIndex(line, index) || index == 0 || index > devices.size())
        throw std::runtime_error("invalid selection '" + line + "'");

    return devices[index - 1];
}
