#pragma once

#include <string>

namespace feeder_monitor {

// Throws HardwareError on failure.
void write_file_str(const std::string & path, const std::string & s);
bool path_exists(const std::string & path);

// One exported line under /sys/class/gpio. The value file stays open for the
// lifetime of the object; the line is unexported on destruction.
class SysfsGpio {
public:
  enum class Direction { In, Out };

  SysfsGpio(int number, Direction dir, const std::string & root = "/sys/class/gpio");
  ~SysfsGpio();

  SysfsGpio(const SysfsGpio &) = delete;
  SysfsGpio & operator=(const SysfsGpio &) = delete;

  void write(bool high);
  bool read();
  int number() const { return number_; }

private:
  std::string root_;
  int number_;
  int fd_{-1};
};

// One channel of a kernel PWM chip (/sys/class/pwm/pwmchipN/pwmM).
class SysfsPwm {
public:
  SysfsPwm(const std::string & chip_path, int channel, long period_ns);
  ~SysfsPwm();

  SysfsPwm(const SysfsPwm &) = delete;
  SysfsPwm & operator=(const SysfsPwm &) = delete;

  // 0..100
  void set_duty_percent(double pct);
  void enable(bool on);

private:
  std::string chip_path_;
  std::string channel_path_;
  int channel_;
  long period_ns_;
  bool enabled_{false};
};

} // namespace feeder_monitor
