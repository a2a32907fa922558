#include <QCoreApplication>

#include <cadence/adapters/qt.hpp>
#include <cadence/cadence.hpp>

#include <chrono>
#include <iostream>
#include <string>

using namespace cadence;
using namespace std::chrono_literals;

int main(int argc, char** argv) {
  QCoreApplication app(argc, argv);

  event_loop loop;
  qt::qt_driver driver(loop);

  int ticks = 0;
  timer_handle h;
  h = loop.set_interval(200ms, [&] {
    std::cout << "[" << loop.now().count() << "ms] tick " << ++ticks << "\n";
    if (ticks == 5) loop.clear_interval(h);
  });

  delay(loop, 300ms, std::string("delayed hello")).then([&](const std::string& s) {
    std::cout << "[" << loop.now().count() << "ms] " << s << "\n";
  });

  driver.on_quiescent([&](const run_report& r) {
    std::cout << "loop quiescent, " << r.units_run << " units run\n";
    app.quit();
  });
  driver.start();

  return app.exec();
}
