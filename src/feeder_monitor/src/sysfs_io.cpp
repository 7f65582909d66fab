#include "feeder_monitor/sysfs_io.hpp"
#include "feeder_monitor/sensor_backend.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstring>
#include <thread>

namespace feeder_monitor {

namespace
{

std::string errno_message(const std::string & what, const std::string & path)
{
  return what + " " + path + ": " + std::strerror(errno);
}

// udev needs a moment to fix permissions on freshly exported nodes
bool wait_for_path(const std::string & path, int attempts)
{
  for (int i = 0; i < attempts; ++i) {
    if (::access(path.c_str(), W_OK) == 0) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return ::access(path.c_str(), W_OK) == 0;
}

} // namespace

void write_file_str(const std::string & path, const std::string & s)
{
  int fd = ::open(path.c_str(), O_WRONLY);
  if (fd < 0) throw HardwareError(errno_message("Failed to open", path));
  const ssize_t n = ::write(fd, s.data(), s.size());
  const int saved = errno;
  ::close(fd);
  if (n < 0 || static_cast<size_t>(n) != s.size()) {
    errno = saved;
    throw HardwareError(errno_message("Failed to write", path));
  }
}

bool path_exists(const std::string & path)
{
  struct stat st;
  return ::stat(path.c_str(), &st) == 0;
}

SysfsGpio::SysfsGpio(int number, Direction dir, const std::string & root)
: root_(root), number_(number)
{
  const std::string line = root_ + "/gpio" + std::to_string(number_);
  bool exported = false;
  if (!path_exists(line)) {
    write_file_str(root_ + "/export", std::to_string(number_));
    exported = true;
  }
  try {
    if (!wait_for_path(line + "/direction", 100)) {
      throw HardwareError("GPIO " + std::to_string(number_) + " did not appear under " + root_);
    }
    write_file_str(line + "/direction", dir == Direction::Out ? "out" : "in");
    fd_ = ::open((line + "/value").c_str(), dir == Direction::Out ? O_RDWR : O_RDONLY);
    if (fd_ < 0) throw HardwareError(errno_message("Failed to open", line + "/value"));
  } catch (const HardwareError &) {
    // the destructor will not run; give back a line we exported ourselves
    if (exported) {
      try {
        write_file_str(root_ + "/unexport", std::to_string(number_));
      } catch (const HardwareError &) {
        // keep the first error
      }
    }
    throw;
  }
}

SysfsGpio::~SysfsGpio()
{
  if (fd_ >= 0) ::close(fd_);
  try {
    write_file_str(root_ + "/unexport", std::to_string(number_));
  } catch (const HardwareError &) {
    // already gone
  }
}

void SysfsGpio::write(bool high)
{
  const char c = high ? '1' : '0';
  if (::pwrite(fd_, &c, 1, 0) != 1) {
    throw HardwareError("GPIO " + std::to_string(number_) + " write failed: " + std::strerror(errno));
  }
}

bool SysfsGpio::read()
{
  char c = '0';
  if (::pread(fd_, &c, 1, 0) != 1) {
    throw HardwareError("GPIO " + std::to_string(number_) + " read failed: " + std::strerror(errno));
  }
  return c == '1';
}

SysfsPwm::SysfsPwm(const std::string & chip_path, int channel, long period_ns)
: chip_path_(chip_path),
  channel_path_(chip_path + "/pwm" + std::to_string(channel)),
  channel_(channel), period_ns_(period_ns)
{
  if (!path_exists(channel_path_)) {
    write_file_str(chip_path_ + "/export", std::to_string(channel_));
  }
  if (!wait_for_path(channel_path_ + "/period", 100)) {
    throw HardwareError("PWM channel did not appear: " + channel_path_);
  }
  // duty must never exceed the period, so zero it first
  write_file_str(channel_path_ + "/enable", "0");
  write_file_str(channel_path_ + "/duty_cycle", "0");
  write_file_str(channel_path_ + "/period", std::to_string(period_ns_));
}

SysfsPwm::~SysfsPwm()
{
  try {
    write_file_str(channel_path_ + "/duty_cycle", "0");
    write_file_str(channel_path_ + "/enable", "0");
    write_file_str(chip_path_ + "/unexport", std::to_string(channel_));
  } catch (const HardwareError &) {
    // chip removed underneath us
  }
}

void SysfsPwm::set_duty_percent(double pct)
{
  const double clamped = std::clamp(pct, 0.0, 100.0);
  const long duty = std::lround(static_cast<double>(period_ns_) * clamped / 100.0);
  write_file_str(channel_path_ + "/duty_cycle", std::to_string(duty));
}

void SysfsPwm::enable(bool on)
{
  if (on == enabled_) return;
  write_file_str(channel_path_ + "/enable", on ? "1" : "0");
  enabled_ = on;
}

} // namespace feeder_monitor
