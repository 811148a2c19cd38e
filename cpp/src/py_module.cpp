#include "backend_factory.hpp"
#include "config.hpp"
#include "dev_debug.hpp"
#include "errors.hpp"
#include "execution_result.hpp"
#include "terminal_session.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <optional>
#include <string>

namespace py = pybind11;
using namespace agentshell::core;

namespace {

py::dict record_to_dict(const CompletionRecord& rec) {
    py::dict out;
    out["pid"] = rec.pid;
    out["exit_code"] = rec.exitCode;
    out["username"] = rec.username;
    out["hostname"] = rec.hostname;
    out["working_dir"] = rec.workingDir;
    if (rec.interpreterPath) out["py_interpreter_path"] = *rec.interpreterPath;
    else out["py_interpreter_path"] = py::none();
    return out;
}

} // namespace

PYBIND11_MODULE(_agentshell, m) {
    m.doc() = "Persistent interactive shell sessions";

    py::register_exception<NotRunningError>(m, "NotRunningError", PyExc_RuntimeError);
    // ValidationError derives from std::invalid_argument, which pybind11 maps to ValueError.

    py::enum_<BackendChoice>(m, "BackendChoice")
        .value("AUTO", BackendChoice::Auto)
        .value("MULTIPLEXER", BackendChoice::Multiplexer)
        .value("RAW_PIPE", BackendChoice::RawPipe)
        .value("PLATFORM_SHELL", BackendChoice::PlatformShell);

    py::enum_<BackendKind>(m, "BackendKind")
        .value("MULTIPLEXER", BackendKind::Multiplexer)
        .value("RAW_PIPE", BackendKind::RawPipe)
        .value("PLATFORM_SHELL", BackendKind::PlatformShell)
        .def("__str__", [](BackendKind k) { return std::string(to_string(k)); });

    py::enum_<CommandStatus>(m, "CommandStatus")
        .value("COMPLETED", CommandStatus::Completed)
        .value("RUNNING", CommandStatus::Running)
        .value("NO_OUTPUT_TIMEOUT", CommandStatus::NoOutputTimeout)
        .value("HARD_TIMEOUT", CommandStatus::HardTimeout)
        .def("__str__", [](CommandStatus s) { return std::string(to_string(s)); });

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("backend", &Config::backend)
        .def_readwrite("shell_path", &Config::shellPath)
        .def_readwrite("multiplexer_path", &Config::multiplexerPath)
        .def_readwrite("powershell_path", &Config::powershellPath)
        .def_readwrite("environment", &Config::environment)
        .def_readwrite("initial_commands", &Config::initialCommands)
        .def_readwrite("history_limit", &Config::historyLimit)
        .def_readwrite("no_output_timeout", &Config::noOutputTimeoutSeconds)
        .def_readwrite("hard_timeout", &Config::hardTimeoutSeconds)
        .def_readwrite("poll_interval", &Config::pollIntervalSeconds)
        .def_readwrite("setup_wait", &Config::setupWaitSeconds)
        .def_readwrite("reader_join_timeout", &Config::readerJoinTimeoutSeconds)
        .def_readwrite("terminate_grace", &Config::terminateGraceSeconds)
        .def_readwrite("screen_clear_delay", &Config::screenClearDelaySeconds)
        .def_readwrite("max_output_chars", &Config::maxOutputChars)
        .def("validate", &Config::validate);

    py::class_<Action>(m, "Action")
        .def(py::init([](std::string command, bool isInput, std::optional<double> timeout, bool reset) {
                 return Action{std::move(command), isInput, timeout, reset};
             }),
             py::arg("command") = "", py::arg("is_input") = false,
             py::arg("timeout") = py::none(), py::arg("reset") = false)
        .def_readwrite("command", &Action::command)
        .def_readwrite("is_input", &Action::isInput)
        .def_readwrite("timeout", &Action::timeout)
        .def_readwrite("reset", &Action::reset);

    py::class_<Observation>(m, "Observation")
        .def_readonly("text", &Observation::text)
        .def_readonly("exit_code", &Observation::exitCode)
        .def_readonly("status", &Observation::status)
        .def_readonly("working_dir", &Observation::workingDir)
        .def_readonly("command", &Observation::commandLabel)
        .def_property_readonly("metadata", [](const Observation& o) -> py::object {
            if (!o.record) return py::none();
            return record_to_dict(*o.record);
        })
        .def("__repr__", [](const Observation& o) {
            return "<Observation status=" + std::string(to_string(o.status)) +
                   " exit_code=" + (o.exitCode ? std::to_string(*o.exitCode) : std::string("None")) + ">";
        });

    py::class_<TerminalSession>(m, "TerminalSession")
        .def("initialize", &TerminalSession::initialize, py::call_guard<py::gil_scoped_release>())
        .def("execute", &TerminalSession::execute, py::arg("action"),
             py::call_guard<py::gil_scoped_release>())
        .def("execute", [](TerminalSession& s, std::string command, bool isInput,
                           std::optional<double> timeout, bool reset) {
                 Action action{std::move(command), isInput, timeout, reset};
                 py::gil_scoped_release nogil;
                 return s.execute(action);
             },
             py::arg("command"), py::arg("is_input") = false,
             py::arg("timeout") = py::none(), py::arg("reset") = false)
        .def("interrupt", &TerminalSession::interrupt, py::call_guard<py::gil_scoped_release>())
        .def("close", &TerminalSession::close, py::call_guard<py::gil_scoped_release>())
        .def_property_readonly("is_busy", [](TerminalSession& s) {
            py::gil_scoped_release nogil;
            return s.is_busy();
        })
        .def_property_readonly("backend_kind", &TerminalSession::backend_kind)
        .def_property_readonly("work_dir", &TerminalSession::work_dir)
        .def_property_readonly("cwd", &TerminalSession::current_dir)
        .def("__enter__", [](TerminalSession& s) -> TerminalSession& {
                 py::gil_scoped_release nogil;
                 s.initialize();
                 return s;
             },
             py::return_value_policy::reference)
        .def("__exit__", [](TerminalSession& s, py::object, py::object, py::object) {
            py::gil_scoped_release nogil;
            s.close();
            return false;
        });

    m.def("create_terminal_session", &create_terminal_session,
          py::arg("work_dir"), py::arg("username") = py::none(), py::arg("config") = Config{},
          py::call_guard<py::gil_scoped_release>());

    m.def("find_executable", &find_executable, py::arg("name"));

    m.def("set_debug", [](bool on, std::string path) {
              agentshell::dev::Logger::instance().enable(on, std::move(path));
          },
          py::arg("on"), py::arg("path") = "");
}
