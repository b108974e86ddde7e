#include <QApplication>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QWidget>

#include <clicky/clicky.hpp>
#include <clicky/adapters/qt.hpp>

#include <chrono>
#include <string>
#include <thread>

using namespace clicky;
using namespace std::chrono_literals;

int main(int argc, char** argv) {
  QApplication app(argc, argv);

  // Created on the GUI thread: continuations run here
  runtime rt{options::from_env()};
  auto queries = rt.make_single_flight<std::string>();

  // ----- UI -----
  QWidget window;
  window.setWindowTitle("clicky | Query Demo");

  auto* input  = new QLineEdit("SELECT count() FROM events");
  auto* run    = new QPushButton("Run");
  auto* cancel = new QPushButton("Cancel");
  auto* status = new QLabel("idle");
  auto* result = new QLabel;

  auto* buttons = new QHBoxLayout;
  buttons->addWidget(run);
  buttons->addWidget(cancel);

  auto* layout = new QVBoxLayout;
  layout->addWidget(new QLabel("Query:"));
  layout->addWidget(input);
  layout->addLayout(buttons);
  layout->addSpacing(8);
  layout->addWidget(status);
  layout->addWidget(result);
  window.setLayout(layout);
  window.resize(420, 180);
  window.show();

  inline_executor ui;
  auto status_sub = rt.status().subscribe(ui, [=](const status_message& m){
    status->setText(QString::fromStdString(m.text));
  });

  // ----- Run: slow fake query on a worker, result delivered by the pump -----
  QObject::connect(run, &QPushButton::clicked, &window, [&, input, result]{
    const auto sql = input->text().trimmed().toStdString();
    const bool started = queries->execute_async(
      [sql](const cancel_token& tok){
        for (int i = 0; i < 30 && !tok.cancelled(); ++i) std::this_thread::sleep_for(50ms);
        return "result of: " + sql;
      },
      [&, result](const task_record<std::string>& r){
        if (r.status == task_status::completed) result->setText(QString::fromStdString(*r.result));
        else if (r.status == task_status::failed) rt.status().error(*r.error);
        else rt.status().info("Query cancelled");
      },
      [&](const std::string& s){ rt.status().info(s); });
    if (!started) rt.status().info("A query is already running");
  });

  QObject::connect(cancel, &QPushButton::clicked, &window, [&]{
    if (!queries->cancel_current()) rt.status().info("Nothing to cancel");
  });

  // The pump ticks on a QTimer; stops with the window
  auto pump_sub = clicky::qt::drive(rt, &window);

  return app.exec();
}
