#pragma once
// Python.h 必须先于标准头文件包含
#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include <memory>
#include <string>

namespace scripthub::exec {

/// 内嵌 CPython 解释器：只用来做语法树分析，从不执行用户代码
/// 进程内只初始化一次，之后释放 GIL，各线程按需获取
class PythonRuntime {
public:
    // 初始化失败时返回 false，error 带原因
    static bool ensureInitialized(std::string& error);

private:
    PythonRuntime() = delete;
};

/// 作用域内持有 GIL
class GilGuard {
public:
    GilGuard() : m_state(PyGILState_Ensure()) {}
    ~GilGuard() { PyGILState_Release(m_state); }

    GilGuard(const GilGuard&) = delete;
    GilGuard& operator=(const GilGuard&) = delete;

private:
    PyGILState_STATE m_state;
};

struct PyObjectDeleter {
    void operator()(PyObject* p) const { Py_XDECREF(p); }
};

// 持有一个新引用
using PyObjectPtr = std::unique_ptr<PyObject, PyObjectDeleter>;

// 取出并清除当前的 Python 异常，返回 "Type: message"
std::string fetchPythonError();

// str(obj) 转 UTF-8；失败时返回空串并清除异常
std::string pyToString(PyObject* obj);

} // namespace scripthub::exec
