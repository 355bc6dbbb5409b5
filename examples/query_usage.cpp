lsamp::client c("127.0.0.1", 7777);
c.timeout(5000000);

try {
  std::cout << c.ping() << " usecs" << std::endl;
  lsamp::query::server_info i = c.info();
  std::cout << i.name << " (" << i.players << "/" << i.max_players << ")" << std::endl;

  lsamp::query::player_list pl = c.players();
  for (size_t n = 0; n < pl.size(); ++n) {
    std::cout << pl[n].name << ": " << pl[n].score << std::endl;
  }
}
catch (lsamp::query::timeout_error &e) {
  std::cerr << "Server is offline." << std::endl;
}
catch (lsamp::query::error &e) {
  std::cerr << "Error: " << e.what() << std::endl;
}
