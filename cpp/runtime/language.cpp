#include "runtime/language.hpp"

#include <kj/debug.h>

#include "util/flags.hpp"

namespace runtime {

const char* const kSystemPath = "/usr/local/bin:/usr/bin:/bin";
const char* const kPrivateDir = ".codebox";

namespace {

// Makes plt.show() and interpreter exit save every open figure under plots/,
// numbered in creation order.
const char* const kSiteCustomize = R"PY(import atexit
import importlib.util
import os
import sys

_saved = []


def _save_figures():
    plt = sys.modules.get("matplotlib.pyplot")
    if plt is None:
        return
    directory = os.path.join(os.getcwd(), "plots")
    os.makedirs(directory, exist_ok=True)
    for num in plt.get_fignums():
        figure = plt.figure(num)
        if any(figure is f for f in _saved):
            continue
        _saved.append(figure)
        figure.savefig(os.path.join(directory, "figure_%03d.png" % len(_saved)))


def _show(*args, **kwargs):
    _save_figures()


class _PyplotFinder:
    def find_spec(self, name, path=None, target=None):
        if name != "matplotlib.pyplot":
            return None
        sys.meta_path.remove(self)
        spec = importlib.util.find_spec(name)
        if spec is None or spec.loader is None:
            return spec
        exec_module = spec.loader.exec_module

        def patched(module):
            exec_module(module)
            module.show = _show

        spec.loader.exec_module = patched
        return spec


sys.meta_path.insert(0, _PyplotFinder())
atexit.register(_save_figures)
)PY";

Language Python() {
  Language lang;
  lang.kind = Language::Kind::PYTHON;
  lang.name = "python";
  lang.image = Flags::python_image;
  lang.interpreter = "python3";
  lang.entry_file = "user_script.py";
  lang.package_manager = "pip";
  lang.out_of_memory_marker = "MemoryError";
  lang.address_space_limit = true;
  return lang;
}

Language Node() {
  Language lang;
  lang.kind = Language::Kind::NODE;
  lang.name = "node";
  lang.image = Flags::node_image;
  lang.interpreter = "node";
  lang.entry_file = "user_script.js";
  lang.package_manager = "npm";
  lang.out_of_memory_marker = "JavaScript heap out of memory";
  lang.address_space_limit = false;
  return lang;
}

}  // namespace

std::vector<std::string> Language::InstallCommand(
    const std::vector<std::string>& packages) const {
  std::vector<std::string> cmd;
  switch (kind) {
    case Kind::PYTHON:
      cmd = {interpreter,
             "-m",
             "pip",
             "install",
             "--quiet",
             "--no-warn-script-location",
             "--disable-pip-version-check",
             "--no-cache-dir",
             "--target",
             std::string(kPrivateDir) + "/packages"};
      break;
    case Kind::NODE:
      cmd = {"npm",        "install",   "--silent", "--no-audit",
             "--no-fund",  "--no-save", "--prefix", "."};
      break;
  }
  cmd.insert(cmd.end(), packages.begin(), packages.end());
  return cmd;
}

std::vector<std::string> Language::RunCommand(int64_t memory_limit_kb) const {
  switch (kind) {
    case Kind::PYTHON:
      return {interpreter, entry_file};
    case Kind::NODE:
      return {interpreter,
              "--max-old-space-size=" + std::to_string(memory_limit_kb / 1024),
              entry_file};
  }
  KJ_UNREACHABLE;
}

std::vector<std::pair<std::string, std::string>> Language::Environment(
    const std::string& workspace_path) const {
  std::string private_dir = workspace_path + "/" + kPrivateDir;
  std::vector<std::pair<std::string, std::string>> env = {
      {"PATH", kSystemPath},
      {"HOME", workspace_path},
      {"TMPDIR", workspace_path},
      {"LANG", "C.UTF-8"},
  };
  switch (kind) {
    case Kind::PYTHON:
      env.emplace_back("PYTHONPATH",
                       private_dir + "/packages:" + private_dir + "/boot");
      env.emplace_back("PYTHONUNBUFFERED", "1");
      env.emplace_back("PYTHONDONTWRITEBYTECODE", "1");
      env.emplace_back("MPLBACKEND", "Agg");
      env.emplace_back("MPLCONFIGDIR", private_dir + "/matplotlib");
      break;
    case Kind::NODE:
      env.emplace_back("NODE_PATH", workspace_path + "/node_modules");
      env.emplace_back("npm_config_cache", private_dir + "/npm-cache");
      env.emplace_back("npm_config_update_notifier", "false");
      break;
  }
  return env;
}

std::vector<std::pair<std::string, std::string>> Language::BootstrapFiles()
    const {
  if (kind == Kind::PYTHON) {
    return {{std::string(kPrivateDir) + "/boot/sitecustomize.py",
             kSiteCustomize}};
  }
  return {};
}

kj::Maybe<Language> Language::FromName(kj::StringPtr name) {
  if (name == "python") return Python();
  if (name == "node") return Node();
  return nullptr;
}

}  // namespace runtime
