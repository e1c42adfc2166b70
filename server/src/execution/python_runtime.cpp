#include "python_runtime.h"
#include <mutex>
#include "log/logger.h"

namespace scripthub::exec {

namespace {
std::once_flag g_initOnce;
std::string g_initError;
}

bool PythonRuntime::ensureInitialized(std::string& error)
{
    std::call_once(g_initOnce, []() {
        if (Py_IsInitialized()) {
            return;
        }

        // 隔离模式：忽略 PYTHON* 环境变量和用户 site-packages，不安装信号处理器
        PyConfig config;
        PyConfig_InitIsolatedConfig(&config);
        config.install_signal_handlers = 0;

        PyStatus status = Py_InitializeFromConfig(&config);
        PyConfig_Clear(&config);
        if (PyStatus_Exception(status)) {
            g_initError = std::string("embedded Python initialization failed: ") +
                          (status.err_msg ? status.err_msg : "unknown");
            Logger::error(g_initError);
            return;
        }

        // 主线程释放 GIL，后续由 GilGuard 按需获取
        PyEval_SaveThread();
        Logger::info(std::string("Embedded Python initialized: ") + Py_GetVersion());
    });

    error = g_initError;
    return g_initError.empty();
}

std::string pyToString(PyObject* obj)
{
    if (!obj) return {};
    PyObjectPtr s(PyObject_Str(obj));
    if (!s) {
        PyErr_Clear();
        return {};
    }
    Py_ssize_t len = 0;
    const char* utf8 = PyUnicode_AsUTF8AndSize(s.get(), &len);
    if (!utf8) {
        PyErr_Clear();
        return {};
    }
    return std::string(utf8, static_cast<size_t>(len));
}

std::string fetchPythonError()
{
    PyObject* type = nullptr;
    PyObject* value = nullptr;
    PyObject* traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    PyObjectPtr t(type), v(value), tb(traceback);

    if (!t) return "unknown Python error";

    std::string name = "Error";
    PyObjectPtr typeName(PyObject_GetAttrString(t.get(), "__name__"));
    if (typeName) {
        name = pyToString(typeName.get());
    } else {
        PyErr_Clear();
    }

    const std::string msg = pyToString(v.get());
    return msg.empty() ? name : name + ": " + msg;
}

} // namespace scripthub::exec
