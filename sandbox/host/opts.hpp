#ifndef FNRUN_SANDBOX_HOST_OPTS_HPP
#define FNRUN_SANDBOX_HOST_OPTS_HPP

namespace fnrun::sandbox {

  struct Options {

    int result_fd;

    bool verbose;
  };

  Options opts(int argc, char** argv);

} // namespace fnrun::sandbox

#endif
